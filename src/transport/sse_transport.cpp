#include "mcpfs/transport/sse_transport.hpp"
#include "mcpfs/error.hpp"
#include "mcpfs/log.hpp"

#include <httplib.h>

#include <condition_variable>
#include <deque>
#include <iomanip>
#include <optional>
#include <random>
#include <sstream>
#include <thread>
#include <vector>

namespace mcpfs {

namespace {

std::string generate_uuid() {
    static thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dis;
    uint64_t a = dis(gen), b = dis(gen);
    // Format as UUID v4
    a = (a & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;
    b = (b & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    oss << std::setw(8)  << (a >> 32);
    oss << "-" << std::setw(4) << ((a >> 16) & 0xFFFF);
    oss << "-" << std::setw(4) << (a & 0xFFFF);
    oss << "-" << std::setw(4) << (b >> 48);
    oss << "-" << std::setw(12) << (b & 0xFFFFFFFFFFFFull);
    return oss.str();
}

} // anonymous namespace

/// One SSE client. POSTed frames queue on `inbound` for the worker; replies
/// queue on `outbound` as formatted events for the stream.
struct SseSession : public IConnection {
    std::string id;
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::string> inbound;
    std::deque<std::string> outbound;
    bool closed = false;
    std::thread worker;

    std::optional<std::string> read_frame() override {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, [this] { return closed || !inbound.empty(); });
        if (inbound.empty()) return std::nullopt;
        std::string frame = std::move(inbound.front());
        inbound.pop_front();
        return frame;
    }

    void write_frame(const std::string& frame) override {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (closed) throw McpTransportError("SSE session " + id + " is closed");
            outbound.push_back("event: message\ndata: " + frame + "\n\n");
        }
        cv.notify_all();
    }

    bool enqueue(std::string frame) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (closed) return false;
            inbound.push_back(std::move(frame));
        }
        cv.notify_all();
        return true;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            closed = true;
        }
        cv.notify_all();
    }

    /// Next chunk for the stream: a queued event, a keepalive comment after
    /// `idle`, or nullopt once closed with nothing left to send.
    std::optional<std::string> next_event(std::chrono::milliseconds idle) {
        std::unique_lock<std::mutex> lock(mutex);
        if (!cv.wait_for(lock, idle, [this] { return closed || !outbound.empty(); })) {
            return std::string(": ping\n\n");
        }
        if (outbound.empty()) return std::nullopt;
        std::string event = std::move(outbound.front());
        outbound.pop_front();
        return event;
    }
};

SseServerTransport::SseServerTransport(Options opts)
    : opts_(std::move(opts))
    , server_(std::make_unique<httplib::Server>()) {
}

SseServerTransport::~SseServerTransport() {
    shutdown();
    close_all_sessions();
}

std::shared_ptr<SseSession> SseServerTransport::open_session() {
    auto session = std::make_shared<SseSession>();
    session->id = generate_uuid();
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        if (sessions_.size() >= static_cast<size_t>(opts_.max_sessions)) {
            log::get("sse")->warn("rejecting stream: {} sessions open", sessions_.size());
            return nullptr;
        }
        sessions_[session->id] = session;
        session->worker = std::thread([this, session] {
            try {
                on_connection_(*session);
            } catch (const std::exception& e) {
                log::get("sse")->error("session {} failed: {}", session->id, e.what());
            }
            session->close();
        });
    }
    log::get("sse")->info("session {} opened", session->id);
    return session;
}

std::shared_ptr<SseSession> SseServerTransport::find_session(const std::string& id) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return nullptr;
    return it->second;
}

void SseServerTransport::finish_session(const std::string& id) {
    std::shared_ptr<SseSession> session;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) return;
        session = it->second;
        sessions_.erase(it);
    }
    session->close();
    if (session->worker.joinable()) session->worker.join();
    log::get("sse")->info("session {} closed", id);
}

void SseServerTransport::close_all_sessions() {
    std::map<std::string, std::shared_ptr<SseSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions.swap(sessions_);
    }
    for (auto& [id, session] : sessions) session->close();
    for (auto& [id, session] : sessions) {
        if (session->worker.joinable()) session->worker.join();
    }
}

size_t SseServerTransport::session_count() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

void SseServerTransport::setup_routes() {
    // GET: open the event stream for a new session
    server_->Get(opts_.sse_path, [this](const httplib::Request&, httplib::Response& res) {
        if (!running_) {
            res.status = 503;
            return;
        }
        auto session = open_session();
        if (!session) {
            res.status = 503;
            return;
        }
        const std::string endpoint = "event: endpoint\ndata: " + opts_.message_path
                                     + "?sessionId=" + session->id + "\n\n";

        res.set_header("Cache-Control", "no-cache");
        res.set_chunked_content_provider("text/event-stream",
            [this, session, endpoint, announced = false](size_t /*offset*/,
                                                        httplib::DataSink& sink) mutable -> bool {
                if (!announced) {
                    announced = true;
                    return sink.write(endpoint.data(), endpoint.size());
                }
                auto event = session->next_event(opts_.keepalive);
                if (!event) {
                    sink.done();
                    return true;
                }
                // Fails once the client has gone away
                return sink.write(event->data(), event->size());
            },
            [this, id = session->id](bool /*success*/) { finish_session(id); });
    });

    // POST: one request frame for an existing session
    server_->Post(opts_.message_path, [this](const httplib::Request& req, httplib::Response& res) {
        if (!req.has_param("sessionId")) {
            res.status = 400;
            res.set_content("{\"error\":\"Missing sessionId\"}", "application/json");
            return;
        }
        auto session = find_session(req.get_param_value("sessionId"));
        if (!session || !session->enqueue(req.body)) {
            res.status = 404;
            res.set_content("{\"error\":\"Session not found\"}", "application/json");
            return;
        }
        res.status = 202;
        res.set_content("Accepted", "text/plain");
    });
}

void SseServerTransport::start(ConnectionHandler on_connection) {
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (shutdown_requested_ || listening_) return;
    }
    if (opts_.max_sessions < 1 || opts_.max_sessions >= opts_.thread_pool_size) {
        throw McpTransportError("SSE max_sessions must be between 1 and thread_pool_size - 1");
    }

    on_connection_ = std::move(on_connection);
    const int pool_size = opts_.thread_pool_size;
    server_->new_task_queue = [pool_size] { return new httplib::ThreadPool(pool_size); };
    setup_routes();

    bool bound = false;
    if (opts_.port == 0) {
        int port = server_->bind_to_any_port(opts_.host);
        bound = port > 0;
        if (bound) bound_port_ = static_cast<uint16_t>(port);
    } else {
        bound = server_->bind_to_port(opts_.host, opts_.port);
        bound_port_ = opts_.port;
    }
    if (!bound) {
        throw McpTransportError("Failed to start SSE server on " + opts_.host + ":"
                                + std::to_string(opts_.port));
    }

    {
        // Once listening_ is set, shutdown() waits for the accept loop and
        // stops it; before that, it leaves start() to bail out here.
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (shutdown_requested_) return;
        listening_ = true;
        running_ = true;
    }
    log::get("sse")->info("listening on {}:{}", opts_.host, bound_port_.load());

    // Blocks until stop()
    server_->listen_after_bind();
    accept_loop_done_ = true;
    running_ = false;
    close_all_sessions();
}

void SseServerTransport::shutdown() {
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        shutdown_requested_ = true;
        if (!listening_) return;
        listening_ = false;
    }
    running_ = false;
    // Closed sessions end their streams so the pool can drain.
    close_all_sessions();
    // listen_after_bind() is committed: wait until the accept loop is up
    // (stop() is a no-op before that) or has already ended on its own.
    while (!server_->is_running() && !accept_loop_done_.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    server_->stop();
}

bool SseServerTransport::is_running() const {
    return running_;
}

} // namespace mcpfs
