//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HostScheduler.cpp
// Purpose: io_context-backed host scheduler
//==========================================================================================================

#include "wsmcp/HostScheduler.h"

namespace wsmcp {

AsioHostScheduler::AsioHostScheduler(boost::asio::io_context& ioc) : ioc(ioc) {}

void AsioHostScheduler::Post(std::function<void()> work) {
    boost::asio::post(ioc, std::move(work));
}

} // namespace wsmcp
