#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace ssdpkit::constants {

//-----------------------------------------------------------------------------
// 传输参数 (Transport Parameters)
//-----------------------------------------------------------------------------

/// @brief SSDP 组播地址
constexpr const char* kMulticastGroup = "239.255.255.250";

/// @brief SSDP 组播端口
constexpr uint16_t kMulticastPort = 1900;

/// @brief 默认组播 TTL
constexpr int kDefaultTtl = 2;

/// @brief 默认绑定地址（所有接口）
constexpr const char* kDefaultBindHost = "0.0.0.0";

/// @brief 接收缓冲区大小
constexpr std::size_t kReceiveBufferSize = 8192;

//-----------------------------------------------------------------------------
// 定时参数 (Timing)
//-----------------------------------------------------------------------------

/// @brief Advertiser 周期性通告间隔
constexpr auto kDefaultAnnounceInterval = std::chrono::milliseconds(60000);

/// @brief Browser 周期性搜索间隔
constexpr auto kDefaultSearchInterval = std::chrono::milliseconds(60000);

/// @brief M-SEARCH 的默认 MX 值（秒）
constexpr int kDefaultSearchWaitSeconds = 3;
constexpr int kMinSearchWaitSeconds = 1;
constexpr int kMaxSearchWaitSeconds = 5;

//-----------------------------------------------------------------------------
// 协议字面量 (Protocol Literals)
//-----------------------------------------------------------------------------

constexpr const char* kSearchStartLine = "M-SEARCH * HTTP/1.1";
constexpr const char* kNotifyStartLine = "NOTIFY * HTTP/1.1";
constexpr const char* kReplyStartLine = "HTTP/1.1 200 OK";

constexpr const char* kSearchMethodPrefix = "M-SEARCH";
constexpr const char* kNotifyMethodPrefix = "NOTIFY";

constexpr const char* kDiscoverMan = "\"ssdp:discover\"";

constexpr const char* kNtsAlive = "ssdp:alive";
constexpr const char* kNtsUpdate = "ssdp:update";
constexpr const char* kNtsByeBye = "ssdp:byebye";

constexpr const char* kTargetAll = "ssdp:all";
constexpr const char* kTargetWildcard = "*";
constexpr const char* kTargetRootDevice = "upnp:rootdevice";

constexpr const char* kHeaderHost = "HOST";
constexpr const char* kHeaderMan = "MAN";
constexpr const char* kHeaderMx = "MX";
constexpr const char* kHeaderSt = "ST";
constexpr const char* kHeaderNt = "NT";
constexpr const char* kHeaderNts = "NTS";
constexpr const char* kHeaderUsn = "USN";
constexpr const char* kHeaderExt = "EXT";

}  // namespace ssdpkit::constants
