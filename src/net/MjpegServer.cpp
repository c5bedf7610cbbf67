#include "net/MjpegServer.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <opencv2/imgcodecs.hpp>

namespace net {

MjpegServer::MjpegServer(int port, int jpegQuality)
    : _port(port), _jpegQuality(jpegQuality), _running(false) {
}

MjpegServer::~MjpegServer() {
    stop();
}

void MjpegServer::start() {
    if (_running) return;

    _serverSocket = socket(AF_INET, SOCK_STREAM, 0);
    if (_serverSocket < 0) {
        throw core::OutputUnavailable("MjpegServer: failed to create socket: " + std::string(std::strerror(errno)));
    }

    int opt = 1;
    setsockopt(_serverSocket, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in address{};
    address.sin_family = AF_INET;
    address.sin_addr.s_addr = INADDR_ANY;
    address.sin_port = htons(static_cast<uint16_t>(_port));

    if (bind(_serverSocket, reinterpret_cast<sockaddr*>(&address), sizeof(address)) < 0) {
        close(_serverSocket);
        _serverSocket = -1;
        throw core::OutputUnavailable("MjpegServer: failed to bind port " + std::to_string(_port));
    }

    if (listen(_serverSocket, 5) < 0) {
        close(_serverSocket);
        _serverSocket = -1;
        throw core::OutputUnavailable("MjpegServer: failed to listen on port " + std::to_string(_port));
    }

    _running = true;
    _serverThread = std::thread(&MjpegServer::serverLoop, this);
    core::Logger::info("MJPEG preview on http://0.0.0.0:", _port, "/");
}

void MjpegServer::stop() {
    if (!_running) return;
    _running = false;

    // Unblock accept()
    if (_serverSocket >= 0) {
        shutdown(_serverSocket, SHUT_RDWR);
        close(_serverSocket);
        _serverSocket = -1;
    }

    if (_serverThread.joinable()) {
        _serverThread.join();
    }

    {
        // Clients check _running under this mutex; taking it here avoids a lost wakeup
        std::lock_guard<std::mutex> lock(_frameMutex);
    }
    _frameCv.notify_all();

    std::vector<std::shared_ptr<Client>> clients;
    {
        std::lock_guard<std::mutex> lock(_clientsMutex);
        for (auto& client : _clients) {
            if (client->active) {
                // Unblocks a pending send()
                shutdown(client->socket, SHUT_RDWR);
                client->active = false;
            }
        }
        clients.swap(_clients);
    }
    for (auto& client : clients) {
        if (client->thread.joinable()) {
            client->thread.join();
        }
    }

    core::Logger::info("MjpegServer stopped.");
}

bool MjpegServer::push(const core::Frame& frame) {
    if (!_running || frame.empty()) return true;

    cleanClients();
    if (!hasClients()) return true;

    std::vector<uchar> buf;
    std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, _jpegQuality};

    try {
        cv::imencode(".jpg", frame.image, buf, params);
    } catch (const cv::Exception& e) {
        core::Logger::error("MjpegServer: JPEG encoding failed for frame ", frame.index, ": ", e.what());
        return true;
    }

    {
        std::lock_guard<std::mutex> lock(_frameMutex);
        _currentJpeg = std::move(buf);
        _frameSeq++;
    }
    _frameCv.notify_all();
    return true;
}

bool MjpegServer::hasClients() {
    std::lock_guard<std::mutex> lock(_clientsMutex);
    return !_clients.empty();
}

void MjpegServer::serverLoop() {
    while (_running) {
        sockaddr_in clientAddr{};
        socklen_t clientLen = sizeof(clientAddr);
        int clientSocket = accept(_serverSocket, reinterpret_cast<sockaddr*>(&clientAddr), &clientLen);

        if (clientSocket < 0) {
            if (_running) {
                core::Logger::warn("MjpegServer: accept failed");
            }
            continue;
        }

        char ip[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &clientAddr.sin_addr, ip, sizeof(ip));
        core::Logger::info("MjpegServer: client connected from ", ip);

        auto client = std::make_shared<Client>();
        client->socket = clientSocket;
        client->active = true;

        std::lock_guard<std::mutex> lock(_clientsMutex);
        client->thread = std::thread(&MjpegServer::handleClient, this, clientSocket);
        _clients.push_back(client);
    }
}

void MjpegServer::handleClient(int clientSocket) {
    const std::string header = "HTTP/1.1 200 OK\r\n"
                               "Cache-Control: no-cache\r\n"
                               "Connection: close\r\n"
                               "Content-Type: multipart/x-mixed-replace; boundary=frame\r\n"
                               "\r\n";

    bool ok = send(clientSocket, header.c_str(), header.size(), MSG_NOSIGNAL) >= 0;
    uint64_t lastSent = 0;

    while (ok && _running) {
        std::vector<uchar> jpegData;
        {
            std::unique_lock<std::mutex> lock(_frameMutex);
            _frameCv.wait(lock, [&] { return _frameSeq != lastSent || !_running; });
            if (!_running) break;
            jpegData = _currentJpeg;
            lastSent = _frameSeq;
        }

        if (jpegData.empty()) continue;

        std::ostringstream oss;
        oss << "--frame\r\n"
            << "Content-Type: image/jpeg\r\n"
            << "Content-Length: " << jpegData.size() << "\r\n"
            << "\r\n";
        const std::string boundary = oss.str();

        ok = send(clientSocket, boundary.c_str(), boundary.size(), MSG_NOSIGNAL) >= 0 &&
             send(clientSocket, jpegData.data(), jpegData.size(), MSG_NOSIGNAL) >= 0 &&
             send(clientSocket, "\r\n", 2, MSG_NOSIGNAL) >= 0;
    }

    // Mark inactive before closing so stop() never shuts down a reused descriptor
    {
        std::lock_guard<std::mutex> lock(_clientsMutex);
        for (auto& client : _clients) {
            if (client->socket == clientSocket) {
                client->active = false;
                break;
            }
        }
    }

    close(clientSocket);
    core::Logger::debug("MjpegServer: client disconnected");
}

void MjpegServer::cleanClients() {
    std::vector<std::shared_ptr<Client>> finished;
    {
        std::lock_guard<std::mutex> lock(_clientsMutex);
        auto it = _clients.begin();
        while (it != _clients.end()) {
            if (!(*it)->active) {
                finished.push_back(*it);
                it = _clients.erase(it);
            } else {
                ++it;
            }
        }
    }
    // Join outside the lock, handleClient takes it on exit
    for (auto& client : finished) {
        if (client->thread.joinable()) {
            client->thread.join();
        }
    }
}

} // namespace net
