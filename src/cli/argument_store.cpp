#include "cli/argument_store.hpp"

#include "cli/flags.hpp"
#include "log/log.hpp"

namespace lth::cli {

namespace {

auto is_flag(const std::string& token) -> bool {
    return !token.empty() && token[0] == '-';
}

} // namespace

auto ArgumentStore::parse(const std::vector<std::string>& args)
    -> Result<ArgumentStore, HarnessError> {
    ArgumentStore store;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& token = args[i];
        if (!is_flag(token)) {
            return HarnessError::malformed("unexpected argument '" + token +
                                           "' without a preceding flag");
        }

        std::optional<std::string> value;
        if (i + 1 < args.size() && !is_flag(args[i + 1])) {
            value = args[++i];
        } else if (flags::takes_value(token)) {
            return HarnessError::malformed("missing value for argument " + token, token);
        }

        store.values_.insert_or_assign(token, std::move(value));
    }

    LTH_LOG_DEBUG("driver", "Parsed " << store.values_.size() << " distinct flags");
    return store;
}

auto ArgumentStore::has(std::string_view flag) const -> bool {
    return values_.find(flag) != values_.end();
}

auto ArgumentStore::get(std::string_view flag) const -> std::optional<std::string> {
    auto it = values_.find(flag);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto ArgumentStore::get_required(std::string_view flag) const
    -> Result<std::string, HarnessError> {
    auto value = get(flag);
    if (!value) {
        return HarnessError::missing_argument(std::string(flag));
    }
    return *std::move(value);
}

} // namespace lth::cli
