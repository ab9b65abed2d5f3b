#pragma once

#include <map>
#include <string>
#include <vector>
#include <boost/filesystem.hpp>
#include <boost/variant.hpp>

namespace fs = boost::filesystem;

typedef boost::variant<bool, int, double, std::string> IncarScalar;
typedef std::vector<IncarScalar> IncarList;
typedef boost::variant<bool, int, double, std::string, IncarList> IncarValue;

// INCAR as an ordered, typed key/value store. Keys are kept upper case.
class Incar
{
public:
    static Incar Load(const fs::path &template_path);
    static Incar Parse(const std::string &text);

    bool Has(const std::string &key) const;

    template <typename T>
    T Get(const std::string &key, const T &default_value) const;

    // a scalar comes back as a one-element list
    IncarList GetList(const std::string &key) const;

    // numbers follow the type already stored under key (ENCUT = 450.0 stays a float)
    template <typename T>
    void Set(const std::string &key, const T &value)
    {
        Assign(key, Coerce(key, IncarValue(value)));
    }

    void Set(const std::string &key, const char *value)
    {
        Assign(key, IncarValue(std::string(value)));
    }

    // deleting an absent key is a no-op
    void Delete(const std::string &key);

    const std::vector<std::string> &Keys() const { return order_; }

    std::string Render() const;
    void Write(const fs::path &path) const;

    static IncarScalar ParseScalar(const std::string &token);
    static std::string FormatScalar(const IncarScalar &value);
    static std::string FormatValue(const IncarValue &value);

private:
    void Assign(const std::string &key, const IncarValue &value);
    IncarValue Coerce(const std::string &key, const IncarValue &value) const;
    const IncarValue *Find(const std::string &key) const;

    std::vector<std::string> order_;
    std::map<std::string, IncarValue> values_;
};

template <>
bool Incar::Get<bool>(const std::string &key, const bool &default_value) const;

template <>
int Incar::Get<int>(const std::string &key, const int &default_value) const;

template <>
double Incar::Get<double>(const std::string &key, const double &default_value) const;

template <>
std::string Incar::Get<std::string>(const std::string &key, const std::string &default_value) const;
