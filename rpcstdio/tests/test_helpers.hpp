#pragma once

#include "client_options.hpp"
#include "frame_decoder.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <vector>

/// Options that spawn the scripted test peer with the given framing.
rpcstdio::ClientOptions peer_options(rpcstdio::Framing framing, const std::vector<std::string>& extra_args = {});

/// Poll `condition` every few milliseconds until it holds or `timeout` passes.
bool wait_until(const std::function<bool()>& condition, std::chrono::milliseconds timeout);

