#pragma once

inline constexpr unsigned short cmNewChat = 3100;
inline constexpr unsigned short cmSendPrompt = 3101;
inline constexpr unsigned short cmCancelTurn = 3102;
inline constexpr unsigned short cmCopySelection = 3103;
inline constexpr unsigned short cmCollapseTools = 3104;
inline constexpr unsigned short cmExpandTools = 3105;
inline constexpr unsigned short cmScrollTop = 3106;
inline constexpr unsigned short cmScrollBottom = 3107;
inline constexpr unsigned short cmAbout = 3108;
inline constexpr unsigned short cmClearChat = 3109;
