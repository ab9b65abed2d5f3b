#include "task.h"
#include "errors.h"
#include "logger.h"
#include "submit_script.h"

#include <algorithm>

namespace
{

////////////////////////// Variant overrides //////////////////////////

void OptOverrides(Incar &incar, const TaskFlags &flags)
{
    // 第一轮低精度预优化, 提交脚本负责恢复
    if (flags.low)
    {
        incar.Set("ENCUT", 300);
        incar.Set("PREC", "Low");
    }
}

void ChargeOverrides(Incar &incar, const TaskFlags &)
{
    incar.Set("IBRION", 1);
    incar.Set("LAECHG", true);
    incar.Set("LCHARG", true);
}

void DOSOverrides(Incar &incar, const TaskFlags &)
{
    incar.Set("ISTART", 1);
    incar.Set("ICHARG", 11);
    incar.Set("IBRION", -1);
    incar.Set("NSW", 1);
    incar.Set("LORBIT", 12);
    incar.Set("NEDOS", 2000);
    incar.Set("LCHARG", false);
    incar.Delete("LAECHG");
}

void BandOverrides(Incar &incar, const TaskFlags &)
{
    incar.Set("ISTART", 1);
    incar.Set("ICHARG", 11);
    incar.Set("IBRION", -1);
    incar.Set("NSW", 1);
    incar.Set("LCHARG", false);
    incar.Delete("LAECHG");
}

void FreqOverrides(Incar &incar, const TaskFlags &)
{
    incar.Set("IBRION", 5);
    incar.Set("ISYM", 0);
    incar.Set("NSW", 1);
    incar.Set("NFREE", 2);
    incar.Set("POTIM", 0.015);
}

void MDOverrides(Incar &incar, const TaskFlags &flags)
{
    incar.Set("IBRION", 0);
    incar.Set("NSW", 100000);
    incar.Set("POTIM", 0.5);
    incar.Set("SMASS", 2.0);
    incar.Set("MDALGO", 2);
    incar.Set("TEBEG", flags.tebeg);
    incar.Set("TEEND", flags.teend);
}

void STMOverrides(Incar &incar, const TaskFlags &)
{
    incar.Set("ISTART", 1);
    incar.Set("IBRION", -1);
    incar.Set("NSW", 0);
    incar.Set("LPARD", true);
    incar.Set("NBMOD", -3);
    incar.Set("EINT", 5.0);
    incar.Set("LSEPB", false);
    incar.Set("LSEPK", false);
}

void ConTSOverrides(Incar &incar, const TaskFlags &)
{
    incar.Set("IBRION", 1);
}

void DimerOverrides(Incar &incar, const TaskFlags &)
{
    incar.Set("IBRION", 3);
    incar.Set("POTIM", 0.0);
    incar.Set("ISYM", 0);
    incar.Set("ICHAIN", 2);
    incar.Set("DdR", 0.005);
    incar.Set("DRotMax", 10);
    incar.Set("DFNMax", 1.0);
    incar.Set("DFNMin", 0.01);
    incar.Set("IOPT", 2);
}

void WorkFuncOverrides(Incar &incar, const TaskFlags &)
{
    incar.Set("IBRION", -1);
    incar.Set("NSW", 1);
    incar.Set("LVHAR", true);
}

void NEBOverrides(Incar &incar, const TaskFlags &flags)
{
    incar.Set("IBRION", 3);
    incar.Set("POTIM", 0.0);
    incar.Set("SPRING", -5.0);
    incar.Set("LCLIMB", false);
    incar.Set("ICHAIN", 0);
    incar.Set("IOPT", 3);
    incar.Set("MAXMOVE", 0.03);
    incar.Set("IMAGES", flags.images);
}

//                                  trajectory constraint multi  line   relax
const TaskCapabilities kRelax      = {true,     false,     false, false, true};
const TaskCapabilities kSinglePoint = {false,   false,     false, false, false};

} // namespace

PathMethod ParsePathMethod(const std::string &name)
{
    if (name == "linear")
    {
        return PathMethod::Linear;
    }
    if (name == "idpp")
    {
        return PathMethod::Idpp;
    }
    throw UnsupportedMethodError(name + " has not been implemented for NEB task, use linear or idpp");
}

const std::vector<TaskRule> &TaskRules()
{
    static const std::vector<TaskRule> rules = {
        {TaskType::Opt, "Opt", "opt", kRelax, OptOverrides},
        {TaskType::Charge, "Charge", "chg", kSinglePoint, ChargeOverrides},
        {TaskType::DOS, "DOS", "dos", kSinglePoint, DOSOverrides},
        {TaskType::Band, "Band", "band", {false, false, false, true, false}, BandOverrides},
        {TaskType::Freq, "Freq", "freq", {true, false, false, false, false}, FreqOverrides},
        {TaskType::MD, "MD", "md", {true, false, false, false, false}, MDOverrides},
        {TaskType::STM, "STM", "stm", kSinglePoint, STMOverrides},
        {TaskType::ConTS, "ConTS", "cont", {true, true, false, false, true}, ConTSOverrides},
        {TaskType::Dimer, "Dimer", "dimer", kRelax, DimerOverrides},
        {TaskType::WorkFunc, "WorkFunc", "wf", kSinglePoint, WorkFuncOverrides},
        {TaskType::NEB, "NEB", "neb", {true, false, true, false, true}, NEBOverrides},
    };
    return rules;
}

const TaskRule &RuleFor(TaskType type)
{
    for (const auto &rule : TaskRules())
    {
        if (rule.type == type)
        {
            return rule;
        }
    }
    throw UnsupportedTaskError("Task has no override rule");
}

TaskType ParseTaskType(const std::string &command)
{
    for (const auto &rule : TaskRules())
    {
        if (command == rule.command)
        {
            return rule.type;
        }
    }
    throw UnsupportedTaskError("Unknown task: " + command);
}

void ApplyUCorrection(Incar &incar, const std::vector<std::string> &elements, const UValueTable &table)
{
    if (!incar.Get<bool>("LDAU", false))
    {
        return;
    }

    IncarList ldaul, ldauu, ldauj;
    bool has_f = false;
    for (const auto &element : elements)
    {
        UValueEntry entry;
        if (!table.Lookup(element, entry))
        {
            LOG_WARNING(element << " not found in UValue, +U parameters set default: LDAUL = -1, LDAUU = 0.0, LDAUJ = 0.0");
            entry = UValueEntry();
        }
        ldaul.push_back(entry.orbital);
        ldauu.push_back(entry.u);
        ldauj.push_back(entry.j);
        has_f = has_f || entry.orbital == 3;
    }
    incar.Set("LDAUL", ldaul);
    incar.Set("LDAUU", ldauu);
    incar.Set("LDAUJ", ldauj);
    incar.Set("LMAXMIX", has_f ? 6 : 4);
}

void ApplyFlagOverrides(Incar &incar, const TaskFlags &flags, const Structure &structure, double valence)
{
    if (flags.vdw)
    {
        incar.Set("IVDW", 12);
    }
    if (flags.sol)
    {
        incar.Set("LSOL", true);
        incar.Set("EB_K", 78.4);
    }
    if (flags.mag)
    {
        IncarList magmom;
        for (const auto &atom : structure.atoms())
        {
            magmom.push_back(atom.spin ? *atom.spin : 0.0);
        }
        incar.Set("ISPIN", 2);
        incar.Set("MAGMOM", magmom);
    }
    if (flags.hse)
    {
        incar.Set("LHFCALC", true);
        incar.Set("HFSCREEN", 0.2);
        incar.Set("AEXX", 0.25);
        incar.Set("ALGO", "Damped");
        incar.Set("TIME", 0.4);
        incar.Set("PRECFOCK", "Fast");
        // DFT+U 与杂化泛函互斥
        std::vector<std::string> keys = incar.Keys();
        for (const auto &key : keys)
        {
            if (key.compare(0, 4, "LDAU") == 0)
            {
                incar.Delete(key);
            }
        }
        incar.Delete("LMAXMIX");
    }
    if (flags.static_ions)
    {
        incar.Set("IBRION", -1);
        incar.Set("NSW", 0);
    }
    if (flags.nelect)
    {
        incar.Set("NELECT", valence + *flags.nelect);
    }
}

void ValidateFlags(TaskType type, const TaskFlags &flags)
{
    const TaskCapabilities &capabilities = RuleFor(type).capabilities;
    if (capabilities.multi_image)
    {
        ParsePathMethod(flags.method);
        if (flags.images < 1)
        {
            throw InvalidOptionError("NEB needs at least one image, got --images " + std::to_string(flags.images));
        }
    }
    if (capabilities.line_mode_kpoints && flags.points < 1)
    {
        throw InvalidOptionError("Band needs at least one point per segment, got --points " + std::to_string(flags.points));
    }
}

const char *CompletionCheck(TaskType type, const TaskFlags &flags)
{
    return RuleFor(type).capabilities.relaxes_ions && !flags.static_ions ? FRAGMENT_CHECK_OPT : FRAGMENT_CHECK_SCF;
}

void BuildIncar(Incar &incar, TaskType type, const TaskFlags &flags, const Structure &structure,
                const UValueTable &table, double valence)
{
    if (!flags.hse)
    {
        ApplyUCorrection(incar, structure.Elements(), table);
    }
    RuleFor(type).apply(incar, flags);
    ApplyFlagOverrides(incar, flags, structure, valence);
}
