#include <hellostate/core/Logging.h>
#include <spdlog/details/os.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <cctype>
#include <optional>

namespace hellostate::core
{
    namespace
    {
        std::string trim(const std::string& text)
        {
            const auto first = text.find_first_not_of(" \t");
            if (first == std::string::npos) return {};
            const auto last = text.find_last_not_of(" \t");
            return text.substr(first, last - first + 1);
        }

        std::optional<spdlog::level::level_enum> parse_level(std::string name)
        {
            std::transform(name.begin(), name.end(), name.begin(),
                [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
            const auto level = spdlog::level::from_str(name);
            // from_str answers "off" for anything it does not know
            if (level == spdlog::level::off && name != "off") return std::nullopt;
            return level;
        }

        std::shared_ptr<spdlog::logger> make_logger()
        {
            auto existing = spdlog::get(LOGGER_NAME);
            if (existing) return existing;

            auto created = spdlog::stdout_color_mt(LOGGER_NAME);
            created->set_level(spdlog::level::info);
            apply_level_spec(*created, spdlog::details::os::getenv("SPDLOG_LEVEL"));
            return created;
        }
    }

    bool apply_level_spec(spdlog::logger& target, const std::string& spec)
    {
        std::optional<spdlog::level::level_enum> bare;
        std::optional<spdlog::level::level_enum> named;

        std::size_t start = 0;
        while (start <= spec.size())
        {
            auto end = spec.find(',', start);
            if (end == std::string::npos) end = spec.size();
            const std::string entry = trim(spec.substr(start, end - start));
            start = end + 1;
            if (entry.empty()) continue;

            const auto eq = entry.find('=');
            if (eq == std::string::npos)
            {
                if (auto level = parse_level(entry)) bare = level;
            }
            else if (trim(entry.substr(0, eq)) == target.name())
            {
                if (auto level = parse_level(trim(entry.substr(eq + 1)))) named = level;
            }
        }

        const auto chosen = named ? named : bare;
        if (!chosen || *chosen == target.level()) return false;
        target.set_level(*chosen);
        return true;
    }

    std::shared_ptr<spdlog::logger> logger()
    {
        static const std::shared_ptr<spdlog::logger> instance = make_logger();
        return instance;
    }
}
