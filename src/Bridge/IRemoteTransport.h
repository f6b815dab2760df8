/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>

namespace FlowEngine {
namespace Core {
namespace Bridge {

    /// Request headers, kept sorted so they serialize the same way every time
    using Headers = std::map<std::string, std::string>;

    /**
     * @brief Moves request bytes to the remote domain and brings the reply back
     *
     * Called only from the bridge's remote worker thread. Implementations throw
     * (any std::exception) when the request could not be delivered; a reply that
     * reports a failed step is still a successful delivery.
     */
    class IRemoteTransport {
    public:
        virtual ~IRemoteTransport() = default;

        virtual std::string send(const std::string& url, const std::string& body, const Headers& headers) = 0;
    };

    using RemoteTransportPtr = std::shared_ptr<IRemoteTransport>;

    /**
     * @brief Transport that hands the body to a function in this process
     *
     * Typically wired to the remote engine's serveRemote().
     *
     * @code
     * auto transport = std::make_shared<InProcessTransport>(
     *     [&remote](const std::string& body) { return remote.serveRemote(body); });
     * @endcode
     */
    class InProcessTransport : public IRemoteTransport {
    public:
        using Handler = std::function<std::string(const std::string& body)>;

        /// @throws std::invalid_argument if handler is empty
        explicit InProcessTransport(Handler handler);

        std::string send(const std::string& url, const std::string& body, const Headers& headers) override;

    private:
        Handler _handler;
    };

} // namespace Bridge
} // namespace Core
} // namespace FlowEngine
