#include "cli/harness_error.hpp"

namespace lth::cli {

auto HarnessError::missing_argument(std::string flag) -> HarnessError {
    return HarnessError{HarnessErrorKind::MissingRequiredArgument, {}, std::move(flag), {}, {}};
}

auto HarnessError::invalid_value(std::string flag, std::string value) -> HarnessError {
    return HarnessError{HarnessErrorKind::InvalidArgumentValue, {}, std::move(flag),
                        std::move(value), {}};
}

auto HarnessError::malformed(std::string message, std::string flag) -> HarnessError {
    return HarnessError{HarnessErrorKind::MalformedArgument, std::move(message), std::move(flag),
                        {}, {}};
}

auto HarnessError::no_action() -> HarnessError {
    return HarnessError{HarnessErrorKind::NoActionSpecified, {}, {}, {}, {}};
}

auto HarnessError::file_access(std::string path, std::string cause) -> HarnessError {
    return HarnessError{HarnessErrorKind::FileAccess, std::move(cause), {}, {}, std::move(path)};
}

auto HarnessError::collaborator(std::string message, std::string path) -> HarnessError {
    return HarnessError{HarnessErrorKind::Collaborator, std::move(message), {}, {},
                        std::move(path)};
}

auto HarnessError::describe() const -> std::string {
    switch (kind) {
    case HarnessErrorKind::MissingRequiredArgument:
        return "Missing required argument: " + flag;
    case HarnessErrorKind::InvalidArgumentValue:
        return "Invalid value '" + value + "' for argument " + flag;
    case HarnessErrorKind::MalformedArgument:
        return "Malformed arguments: " + message;
    case HarnessErrorKind::NoActionSpecified:
        return "No action specified.\nSee -help for information about available actions";
    case HarnessErrorKind::FileAccess:
        return message.empty() ? "Cannot access file '" + path + "'" : message;
    case HarnessErrorKind::Collaborator:
        return message;
    }
    return message;
}

} // namespace lth::cli
