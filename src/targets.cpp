#include "bulkdl/targets.hpp"

#include "bulkdl/errors.hpp"

#include <fstream>
#include <utility>

#include <fmt/format.h>

namespace bulkdl {

TargetList expandTemplate(const std::string& tmpl, std::int64_t start, std::int64_t end) {
    if (start > end) {
        throw ConfigurationError(fmt::format("start ({}) must not be greater than end ({})", start, end));
    }
    if (tmpl.find(kPlaceholder) == std::string::npos) {
        throw ConfigurationError(fmt::format("address template '{}' has no {} placeholder", tmpl, kPlaceholder));
    }

    const std::uint64_t span = static_cast<std::uint64_t>(end) - static_cast<std::uint64_t>(start);
    TargetList targets;
    if (span >= targets.max_size()) {
        throw ConfigurationError(fmt::format("range {}..{} is too large", start, end));
    }
    targets.reserve(static_cast<std::size_t>(span) + 1);
    for (std::int64_t i = start;; ++i) {
        const std::string number = std::to_string(i);

        std::string address;
        address.reserve(tmpl.size() + number.size());
        std::size_t pos = 0;
        while (true) {
            const std::size_t hit = tmpl.find(kPlaceholder, pos);
            if (hit == std::string::npos) {
                address.append(tmpl, pos, std::string::npos);
                break;
            }
            address.append(tmpl, pos, hit - pos);
            address += number;
            pos = hit + kPlaceholder.size();
        }
        targets.push_back(std::move(address));

        // end may be INT64_MAX
        if (i == end) {
            break;
        }
    }
    return targets;
}

TargetList readTargetFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw ConfigurationError(fmt::format("cannot open address list '{}'", path));
    }

    TargetList targets;
    std::string line;
    while (std::getline(in, line)) {
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }
        targets.push_back(line);
    }
    if (in.bad()) {
        throw ConfigurationError(fmt::format("failed reading address list '{}'", path));
    }
    return targets;
}

} // namespace bulkdl
