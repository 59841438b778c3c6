#include "DiscoverySettings.hpp"

#include <cctype>
#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace whos_home::common
{
    namespace
    {
        std::string Trim(const std::string &text, const char *chars = " \t\r\n")
        {
            auto first = text.find_first_not_of(chars);
            if (first == std::string::npos)
                return "";
            auto last = text.find_last_not_of(chars);
            return text.substr(first, last - first + 1);
        }

        std::optional<double> ParsePositiveSeconds(const std::string &text, double max_seconds)
        {
            try
            {
                size_t used = 0;
                double value = std::stod(Trim(text), &used);
                if (used != Trim(text).size() || !std::isfinite(value) || value <= 0 || value > max_seconds)
                {
                    std::cout << "[Settings] Ignoring invalid duration '" << text << "'\n";
                    return std::nullopt;
                }
                return value;
            }
            catch (const std::exception &)
            {
                return std::nullopt;
            }
        }
    }

    std::vector<ProbeMethod> ParseMethodList(const std::string &text)
    {
        std::vector<ProbeMethod> methods;
        std::string body = Trim(text);
        if (!body.empty() && body.front() == '[')
            body = body.substr(1);
        if (!body.empty() && body.back() == ']')
            body.pop_back();

        std::stringstream ss(body);
        std::string item;
        while (std::getline(ss, item, ','))
        {
            std::string name = Trim(item, " \t\r\n\"'");
            auto method = ParseProbeMethod(name);
            if (method)
                methods.push_back(*method);
            else if (!name.empty())
                std::cout << "[Settings] Ignoring unknown discovery method '" << name << "'\n";
        }
        return methods;
    }

    std::string FormatMethodList(const std::vector<ProbeMethod> &methods)
    {
        std::string out = "[";
        for (size_t i = 0; i < methods.size(); ++i)
        {
            if (i > 0)
                out += ", ";
            out += "\"" + ToString(methods[i]) + "\"";
        }
        out += "]";
        return out;
    }

    std::optional<int> ParsePositiveInt(const std::string &text, int max_value)
    {
        const std::string digits = Trim(text);
        if (digits.empty() || digits.size() > 9)
            return std::nullopt;
        for (char c : digits)
        {
            if (!std::isdigit(static_cast<unsigned char>(c)))
                return std::nullopt;
        }

        int value = std::stoi(digits);
        if (value <= 0 || value > max_value)
            return std::nullopt;
        return value;
    }

    std::string FormatSeconds(double seconds)
    {
        std::ostringstream ss;
        if (std::floor(seconds) == seconds)
            ss << static_cast<long long>(seconds);
        else
            ss << seconds;
        return ss.str();
    }

    SettingsPatch SettingsPatch::FromKeyValues(const std::map<std::string, std::string> &values)
    {
        SettingsPatch patch;

        for (const auto &[key, value] : values)
        {
            if (key == "discovery_methods")
            {
                patch.methods = ParseMethodList(value);
            }
            else if (key == "network_range")
            {
                std::string range = Trim(value);
                if (!range.empty())
                    patch.network_range = range;
            }
            else if (key == "ping_timeout")
            {
                patch.ping_timeout_seconds = ParsePositiveSeconds(value, MAX_TIMEOUT_SECONDS);
            }
            else if (key == "arping_timeout")
            {
                patch.arping_timeout_seconds = ParsePositiveSeconds(value, MAX_TIMEOUT_SECONDS);
            }
            else if (key == "scan_interval")
            {
                auto interval = ParsePositiveSeconds(value, MAX_SCAN_INTERVAL_SECONDS);
                if (interval && *interval >= 1)
                    patch.scan_interval_seconds = static_cast<int>(*interval);
            }
        }
        return patch;
    }

    DiscoverySettings DiscoverySettings::Merge(const SettingsPatch &patch) const
    {
        DiscoverySettings merged = *this;
        if (patch.methods)
            merged.methods = *patch.methods;
        if (patch.network_range)
            merged.network_range = *patch.network_range;
        if (patch.ping_timeout_seconds)
            merged.ping_timeout_seconds = *patch.ping_timeout_seconds;
        if (patch.arping_timeout_seconds)
            merged.arping_timeout_seconds = *patch.arping_timeout_seconds;
        if (patch.scan_interval_seconds)
            merged.scan_interval_seconds = *patch.scan_interval_seconds;
        return merged;
    }

    std::map<std::string, std::string> DiscoverySettings::ToKeyValues() const
    {
        return {
            {"scan_interval", std::to_string(scan_interval_seconds)},
            {"discovery_methods", FormatMethodList(methods)},
            {"network_range", network_range},
            {"ping_timeout", FormatSeconds(ping_timeout_seconds)},
            {"arping_timeout", FormatSeconds(arping_timeout_seconds)},
        };
    }
}
