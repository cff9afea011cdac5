#pragma once

#include "engine/EventBus.hpp"
#include "rpc/Dispatcher.hpp"

#include <mongoose.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace rotor::engine
{
class PoolScheduler;
}

namespace rotor::rpc
{

struct ServerOptions
{
    std::optional<std::string> token;
    std::string token_header = "X-Rotor-Auth";
    std::string rpc_path = "/rotor/rpc";
    std::string ws_path = "/ws";
};

// HTTP front end of the Dispatcher. Mongoose runs on a worker thread owned
// by the server; handler replies and event pushes are queued to that thread.
class Server
{
  public:
    Server(engine::PoolScheduler *pool, engine::EventBus *bus,
           std::string bind_url = "http://127.0.0.1:8765",
           ServerOptions options = {}, ShutdownHook request_shutdown = {});
    ~Server();

    Server(Server const &) = delete;
    Server &operator=(Server const &) = delete;

    bool start();
    void stop();

    // Port actually bound; useful when the bind URL asked for port 0.
    std::uint16_t port() const noexcept;

  private:
    void run_loop();
    static void handle_event(struct mg_connection *conn, int ev, void *ev_data);
    void handle_http_message(struct mg_connection *conn,
                             struct mg_http_message *hm);
    void handle_connection_closed(struct mg_connection *conn);
    bool authorize_request(struct mg_http_message *hm) const;
    bool host_allowed(struct mg_http_message *hm) const;

    void enqueue_task(std::function<void()> task);
    void process_pending_tasks();
    void send_response(std::uint64_t req_id, std::string const &response);
    void broadcast(std::string const &payload);

    std::string bind_url_;
    ServerOptions options_;
    engine::EventBus *bus_;
    Dispatcher dispatcher_;
    mg_mgr mgr_;
    struct mg_connection *listener_ = nullptr;
    std::atomic<std::uint16_t> port_{0};
    std::atomic_bool running_{false};
    std::atomic_bool destroying_{false};
    std::thread worker_;
    bool loopback_only_ = false;
    engine::EventBus::SubscriptionId event_subscription_ = 0;

    struct ActiveRequest
    {
        struct mg_connection *conn = nullptr;
    };
    using RequestId = std::uint64_t;
    RequestId next_request_id_ = 1;
    // touched only by the mongoose thread
    std::unordered_map<RequestId, ActiveRequest> active_requests_;
    std::vector<struct mg_connection *> ws_clients_;

    std::vector<std::function<void()>> pending_tasks_;
    std::mutex tasks_mtx_;
};

} // namespace rotor::rpc
