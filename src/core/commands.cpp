#include "core/commands.hpp"

#include <type_traits>

namespace tether::commands {

std::string_view command_name(const CoreCommand& command) {
    return std::visit([](const auto& c) -> std::string_view {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, Pair>) return "pair";
        else if constexpr (std::is_same_v<T, Unpair>) return "unpair";
        else if constexpr (std::is_same_v<T, Ping>) return "ping";
        else if constexpr (std::is_same_v<T, SendFiles>) return "sendFiles";
        else if constexpr (std::is_same_v<T, SendClipboard>) return "sendClipboard";
        else if constexpr (std::is_same_v<T, RequestConversations>) return "requestConversations";
        else if constexpr (std::is_same_v<T, RequestConversation>) return "requestConversation";
        else if constexpr (std::is_same_v<T, SendSms>) return "sendSms";
        else if constexpr (std::is_same_v<T, StartSftpBrowsing>) return "startSftpBrowsing";
        else if constexpr (std::is_same_v<T, ExecuteCommand>) return "executeCommand";
        else if constexpr (std::is_same_v<T, RequestCommandList>) return "requestCommandList";
        else if constexpr (std::is_same_v<T, RequestBatteryStatus>) return "requestBatteryStatus";
    }, command);
}

} // namespace tether::commands
