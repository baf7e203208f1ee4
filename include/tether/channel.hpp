#pragma once

#include <glaze/glaze.hpp>

#include <chrono>
#include <future>
#include <string_view>

namespace tether {

    // Anything that can carry one JSON-RPC request and eventually produce its result
    class rpc_channel {
      public:
        virtual ~rpc_channel() = default;

        // Failures surface as rpc_error from future::get()
        virtual std::future<glz::raw_json> send_request(
                std::string_view method, std::string_view params_json, std::chrono::milliseconds timeout) = 0;
    };

}  // namespace tether
