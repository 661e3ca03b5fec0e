// compaction.h
#pragma once
#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace vrpeasy
{

using json = nlohmann::json;

// Writes the wire form of one entity. A field equal to its documented default
// is left out unless the writer runs in debug (full) mode.
class FieldWriter
{
public:
    explicit FieldWriter(bool debug) : debug_(debug), out_(json::object()) {}

    template <typename T>
    FieldWriter &always(const char *key, const T &value)
    {
        out_[key] = value;
        return *this;
    }

    template <typename T, typename D>
    FieldWriter &unless_default(const char *key, const T &value, const D &default_value)
    {
        if (debug_ || !is_default(value, default_value))
            out_[key] = value;
        return *this;
    }

    bool debug() const { return debug_; }
    json release() { return std::move(out_); }

    template <typename T, typename D>
    static bool is_default(const T &value, const D &default_value)
    {
        return value == static_cast<T>(default_value);
    }

    template <typename T, typename D>
    static bool is_default(const std::vector<T> &value, const D &)
    {
        return value.empty();
    }

private:
    bool debug_;
    json out_;
};

} // namespace vrpeasy
