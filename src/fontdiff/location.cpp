#include <fontdiff/location.h>

#include <ytrace/ytrace.hpp>

#include <sstream>

namespace fontdiff {

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

Result<Location> parseLocation(const std::string& spec) {
    Location location;
    std::istringstream ss(spec);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (item.empty()) continue;

        auto eq = item.find('=');
        if (eq == std::string::npos) {
            return Err<Location>("bad location '" + item + "': expected axis=value");
        }
        std::string tag = trim(item.substr(0, eq));
        std::string valueStr = trim(item.substr(eq + 1));
        if (tag.empty() || tag.size() > 4) {
            return Err<Location>("bad axis tag '" + tag + "'");
        }

        double value = 0.0;
        try {
            size_t pos = 0;
            value = std::stod(valueStr, &pos);
            if (pos != valueStr.size()) {
                return Err<Location>("bad value for axis " + tag + ": '" + valueStr + "'");
            }
        } catch (const std::exception&) {
            return Err<Location>("bad value for axis " + tag + ": '" + valueStr + "'");
        }
        location.push_back({tag, value});
    }

    if (location.empty()) {
        return Err<Location>("empty location");
    }
    return Ok(std::move(location));
}

std::string formatLocation(const Location& location) {
    std::ostringstream ss;
    for (size_t i = 0; i < location.size(); ++i) {
        if (i > 0) ss << ",";
        ss << location[i].tag << "=" << location[i].value;
    }
    return ss.str();
}

Result<Location> resolveInstance(const FontSource& font, const std::string& name) {
    for (const auto& instance : font.namedInstances()) {
        if (instance.name == name) {
            return Ok(instance.location);
        }
    }
    return Err<Location>("no instance named '" + name + "' in " + font.name());
}

Result<void> applyLocation(FontSource& fontA, FontSource& fontB,
                           const std::string& locationSpec,
                           const std::string& instanceName) {
    if (!locationSpec.empty() && !instanceName.empty()) {
        return Err("--location and --instance are mutually exclusive");
    }

    if (!locationSpec.empty()) {
        auto location = parseLocation(locationSpec);
        if (!location) return Err("invalid location", location);
        if (auto res = fontA.setLocation(*location); !res) return Err("old font", res);
        if (auto res = fontB.setLocation(*location); !res) return Err("new font", res);
        yinfo("Comparing at location {}", formatLocation(*location));
        return Ok();
    }

    if (!instanceName.empty()) {
        auto locA = resolveInstance(fontA, instanceName);
        if (!locA) return Err("old font", locA);
        auto locB = resolveInstance(fontB, instanceName);
        if (!locB) return Err("new font", locB);
        if (auto res = fontA.setLocation(*locA); !res) return Err("old font", res);
        if (auto res = fontB.setLocation(*locB); !res) return Err("new font", res);
        yinfo("Comparing instance '{}'", instanceName);
    }
    return Ok();
}

} // namespace fontdiff
