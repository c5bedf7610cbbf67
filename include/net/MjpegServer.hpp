#pragma once

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <thread>
#include <condition_variable>
#include <atomic>
#include <cstdint>
#include <opencv2/core.hpp>

#include "core/FrameSink.hpp"
#include "core/Types.hpp"

namespace net {

/**
 * Serves the composited stream as multipart MJPEG over HTTP
 * (open http://<host>:<port>/ in a browser).
 *
 * push() encodes the frame once and wakes every client thread; clients
 * always receive the newest frame and skip the ones they were too slow for.
 */
class MjpegServer : public core::FrameSink {
public:
    explicit MjpegServer(int port, int jpegQuality = core::DEFAULT_JPEG_QUALITY);
    ~MjpegServer() override;

    MjpegServer(const MjpegServer&) = delete;
    MjpegServer& operator=(const MjpegServer&) = delete;

    /**
     * Binds and starts the accept thread. Throws core::OutputUnavailable on failure.
     */
    void start();
    void stop();

    bool push(const core::Frame& frame) override;

    bool hasClients();

    [[nodiscard]] int port() const { return _port; }

private:
    void serverLoop();
    void handleClient(int clientSocket);
    void cleanClients();

    int _serverSocket = -1;
    int _port;
    int _jpegQuality;
    std::atomic<bool> _running;
    std::thread _serverThread;

    struct Client {
        int socket = -1;
        std::thread thread;
        std::atomic<bool> active{false};
    };

    std::vector<std::shared_ptr<Client>> _clients;
    std::mutex _clientsMutex;

    // Latest encoded frame; the sequence number lets clients detect new frames
    std::vector<uchar> _currentJpeg;
    uint64_t _frameSeq = 0;
    std::mutex _frameMutex;
    std::condition_variable _frameCv;
};

} // namespace net
