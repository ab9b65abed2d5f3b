#include "incar.h"
#include "errors.h"
#include "vasp_tool.h"

#include <boost/optional.hpp>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace
{

struct ScalarFormatter : public boost::static_visitor<std::string>
{
    std::string operator()(bool value) const { return value ? ".TRUE." : ".FALSE."; }
    std::string operator()(int value) const { return std::to_string(value); }
    std::string operator()(double value) const
    {
        std::ostringstream oss;
        oss << std::setprecision(10) << value;
        std::string text = oss.str();
        if (text.find_first_of(".eEn") == std::string::npos)
        {
            text += ".0";
        }
        return text;
    }
    std::string operator()(const std::string &value) const { return value; }
};

struct ValueFormatter : public boost::static_visitor<std::string>
{
    std::string operator()(const IncarList &values) const
    {
        std::string text;
        for (std::size_t i = 0; i < values.size(); ++i)
        {
            if (i)
            {
                text += " ";
            }
            text += Incar::FormatScalar(values[i]);
        }
        return text;
    }
    template <typename T>
    std::string operator()(const T &value) const
    {
        return ScalarFormatter()(value);
    }
};

struct ScalarToValue : public boost::static_visitor<IncarValue>
{
    template <typename T>
    IncarValue operator()(const T &value) const
    {
        return IncarValue(value);
    }
};

struct ValueToList : public boost::static_visitor<IncarList>
{
    IncarList operator()(const IncarList &values) const { return values; }
    template <typename T>
    IncarList operator()(const T &value) const
    {
        return IncarList(1, IncarScalar(value));
    }
};

// int <-> double only; an int stays an int when the new value is integral
IncarScalar CoerceScalar(const IncarScalar &like, const IncarScalar &value)
{
    if (boost::get<double>(&like))
    {
        if (const int *number = boost::get<int>(&value))
        {
            return static_cast<double>(*number);
        }
    }
    else if (boost::get<int>(&like))
    {
        const double *number = boost::get<double>(&value);
        if (number && std::floor(*number) == *number && std::fabs(*number) < 1e9)
        {
            return static_cast<int>(*number);
        }
    }
    return value;
}

struct ValueToScalar : public boost::static_visitor<boost::optional<IncarScalar>>
{
    boost::optional<IncarScalar> operator()(const IncarList &) const { return boost::none; }
    template <typename T>
    boost::optional<IncarScalar> operator()(const T &value) const
    {
        return IncarScalar(value);
    }
};

bool IsInteger(const std::string &token)
{
    std::size_t start = (token[0] == '+' || token[0] == '-') ? 1 : 0;
    if (start == token.size())
    {
        return false;
    }
    return token.find_first_not_of("0123456789", start) == std::string::npos && token.size() - start < 10;
}

} // namespace

////////////////////////// Incar //////////////////////////

Incar Incar::Load(const fs::path &template_path)
{
    std::ifstream infile(template_path.string());
    if (!infile.is_open())
    {
        throw std::runtime_error("Cannot open file: " + template_path.string());
    }
    std::stringstream buffer;
    buffer << infile.rdbuf();
    return Parse(buffer.str());
}

Incar Incar::Parse(const std::string &text)
{
    Incar incar;
    std::istringstream iss(text);
    std::string line;
    int line_number = 0;
    while (std::getline(iss, line))
    {
        ++line_number;
        std::size_t comment = line.find_first_of("#!");
        if (comment != std::string::npos)
        {
            line = line.substr(0, comment);
        }

        // "ISTART = 0; ICHARG = 2" is two assignments
        std::istringstream statements(line);
        std::string statement;
        while (std::getline(statements, statement, ';'))
        {
            if (Trim(statement).empty())
            {
                continue;
            }
            std::size_t pos = statement.find('=');
            if (pos == std::string::npos)
            {
                throw FormatError("Line " + std::to_string(line_number) + " is not KEY = VALUE: " + Trim(statement));
            }
            std::string key = Trim(statement.substr(0, pos));
            std::vector<std::string> tokens = SplitWhitespace(statement.substr(pos + 1));
            if (key.empty() || tokens.empty())
            {
                throw FormatError("Line " + std::to_string(line_number) + " has an empty key or value");
            }

            if (tokens.size() == 1)
            {
                incar.Assign(key, boost::apply_visitor(ScalarToValue(), ParseScalar(tokens[0])));
            }
            else
            {
                IncarList values;
                for (const auto &token : tokens)
                {
                    values.push_back(ParseScalar(token));
                }
                incar.Assign(key, values);
            }
        }
    }
    return incar;
}

bool Incar::Has(const std::string &key) const
{
    return Find(key) != nullptr;
}

const IncarValue *Incar::Find(const std::string &key) const
{
    auto it = values_.find(ToUpper(key));
    return it == values_.end() ? nullptr : &it->second;
}

template <>
bool Incar::Get<bool>(const std::string &key, const bool &default_value) const
{
    const IncarValue *value = Find(key);
    if (value == nullptr)
    {
        return default_value;
    }
    if (const bool *flag = boost::get<bool>(value))
    {
        return *flag;
    }
    throw FormatError(key + " is not a logical value: " + FormatValue(*value));
}

template <>
int Incar::Get<int>(const std::string &key, const int &default_value) const
{
    const IncarValue *value = Find(key);
    if (value == nullptr)
    {
        return default_value;
    }
    if (const int *number = boost::get<int>(value))
    {
        return *number;
    }
    throw FormatError(key + " is not an integer: " + FormatValue(*value));
}

template <>
double Incar::Get<double>(const std::string &key, const double &default_value) const
{
    const IncarValue *value = Find(key);
    if (value == nullptr)
    {
        return default_value;
    }
    if (const double *number = boost::get<double>(value))
    {
        return *number;
    }
    if (const int *number = boost::get<int>(value))
    {
        return *number;
    }
    throw FormatError(key + " is not a number: " + FormatValue(*value));
}

template <>
std::string Incar::Get<std::string>(const std::string &key, const std::string &default_value) const
{
    const IncarValue *value = Find(key);
    return value == nullptr ? default_value : FormatValue(*value);
}

IncarList Incar::GetList(const std::string &key) const
{
    const IncarValue *value = Find(key);
    if (value == nullptr)
    {
        return IncarList();
    }
    // 单个值也按列表返回
    return boost::apply_visitor(ValueToList(), *value);
}

void Incar::Assign(const std::string &key, const IncarValue &value)
{
    std::string name = ToUpper(Trim(key));
    if (values_.find(name) == values_.end())
    {
        order_.push_back(name);
    }
    values_[name] = value;
}

IncarValue Incar::Coerce(const std::string &key, const IncarValue &value) const
{
    const IncarValue *existing = Find(key);
    if (existing == nullptr)
    {
        return value;
    }

    const IncarList *old_list = boost::get<IncarList>(existing);
    const IncarList *new_list = boost::get<IncarList>(&value);
    if (old_list && new_list)
    {
        if (old_list->empty())
        {
            return value;
        }
        IncarList coerced;
        for (std::size_t i = 0; i < new_list->size(); ++i)
        {
            coerced.push_back(CoerceScalar((*old_list)[std::min(i, old_list->size() - 1)], (*new_list)[i]));
        }
        return coerced;
    }

    boost::optional<IncarScalar> like = boost::apply_visitor(ValueToScalar(), *existing);
    boost::optional<IncarScalar> scalar = boost::apply_visitor(ValueToScalar(), value);
    if (like && scalar)
    {
        return boost::apply_visitor(ScalarToValue(), CoerceScalar(*like, *scalar));
    }
    return value;
}

void Incar::Delete(const std::string &key)
{
    std::string name = ToUpper(Trim(key));
    if (values_.erase(name))
    {
        order_.erase(std::find(order_.begin(), order_.end(), name));
    }
}

std::string Incar::Render() const
{
    std::ostringstream oss;
    for (const auto &key : order_)
    {
        oss << key << " = " << FormatValue(values_.at(key)) << "\n";
    }
    return oss.str();
}

void Incar::Write(const fs::path &path) const
{
    std::ofstream outfile(path.string());
    if (!outfile.is_open())
    {
        throw std::runtime_error("Cannot write file: " + path.string());
    }
    outfile << Render();
}

IncarScalar Incar::ParseScalar(const std::string &token)
{
    std::string upper = ToUpper(token);
    if (upper == ".TRUE." || upper == ".T." || upper == "T" || upper == "TRUE")
    {
        return true;
    }
    if (upper == ".FALSE." || upper == ".F." || upper == "F" || upper == "FALSE")
    {
        return false;
    }
    if (IsInteger(token))
    {
        return std::stoi(token);
    }

    char *end = nullptr;
    double number = std::strtod(token.c_str(), &end);
    if (end != token.c_str() && *end == '\0')
    {
        return number;
    }
    return token;
}

std::string Incar::FormatScalar(const IncarScalar &value)
{
    return boost::apply_visitor(ScalarFormatter(), value);
}

std::string Incar::FormatValue(const IncarValue &value)
{
    return boost::apply_visitor(ValueFormatter(), value);
}
