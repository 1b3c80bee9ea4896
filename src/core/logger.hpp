#pragma once

// 库内部头文件：不安装，不对外暴露 spdlog 类型。

#include <spdlog/spdlog.h>

namespace cbor::core {

// 名为 "cbor" 的 logger（首次使用时创建，输出到 stderr）。
[[nodiscard]] spdlog::logger &logger();

} // namespace cbor::core
