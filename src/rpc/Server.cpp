#include "rpc/Server.hpp"

#include "engine/Events.hpp"
#include "rpc/Serializer.hpp"
#include "utils/Endpoint.hpp"
#include "utils/Log.hpp"
#include "utils/Shutdown.hpp"

#include <algorithm>
#include <cstddef>
#include <exception>
#include <string_view>
#include <utility>

namespace
{

constexpr std::size_t kMaxHttpPayloadSize = 1 << 20;
constexpr int kPollIntervalMs = 50;
constexpr char const kJsonHeaders[] = "Content-Type: application/json\r\n";

std::string_view to_view(struct mg_str const &value)
{
    return {value.buf, value.len};
}

std::optional<std::string_view> header_value(struct mg_http_message *hm,
                                             char const *name)
{
    auto *header = mg_http_get_header(hm, name);
    if (header == nullptr)
    {
        return std::nullopt;
    }
    return to_view(*header);
}

std::optional<std::string> query_token(struct mg_http_message *hm)
{
    char buffer[128] = {};
    int len = mg_http_get_var(&hm->query, "token", buffer, sizeof(buffer));
    if (len <= 0)
    {
        return std::nullopt;
    }
    return std::string(buffer, static_cast<std::size_t>(len));
}

} // namespace

namespace rotor::rpc
{

Server::Server(engine::PoolScheduler *pool, engine::EventBus *bus,
               std::string bind_url, ServerOptions options,
               ShutdownHook request_shutdown)
    : bind_url_(std::move(bind_url)), options_(std::move(options)), bus_(bus),
      dispatcher_(pool, std::move(request_shutdown))
{
    loopback_only_ =
        rotor::net::is_loopback_host(rotor::net::parse_bind_url(bind_url_).host);
    mg_mgr_init(&mgr_);
    mgr_.userdata = this;
}

Server::~Server()
{
    // callbacks check this flag before touching members
    destroying_.store(true, std::memory_order_release);
    stop();
    ws_clients_.clear();
    mg_mgr_free(&mgr_);
}

bool Server::start()
{
    if (running_.exchange(true))
    {
        return true;
    }
    if (!loopback_only_ && !options_.token)
    {
        ROTOR_LOG_WARN("RPC listener on {} accepts requests without a token",
                       bind_url_);
    }
    listener_ = mg_http_listen(&mgr_, bind_url_.c_str(), &Server::handle_event,
                               this);
    if (listener_ == nullptr)
    {
        ROTOR_LOG_ERROR("Failed to bind RPC listener to {}", bind_url_);
        running_.store(false, std::memory_order_release);
        return false;
    }
    port_.store(mg_ntohs(listener_->loc.port), std::memory_order_release);
    ROTOR_LOG_INFO("RPC listener bound to {} (port {}), exposing {}", bind_url_,
                   port(), options_.rpc_path);

    if (bus_ != nullptr)
    {
        event_subscription_ = bus_->subscribe<engine::PoolEventPublished>(
            [this](engine::PoolEventPublished const &published)
            {
                auto payload = serialize_event(published.event);
                enqueue_task([this, payload = std::move(payload)]
                             { broadcast(payload); });
            });
    }
    worker_ = std::thread(&Server::run_loop, this);
    return true;
}

void Server::stop()
{
    if (bus_ != nullptr && event_subscription_ != 0)
    {
        bus_->unsubscribe(event_subscription_);
        event_subscription_ = 0;
    }
    running_.store(false, std::memory_order_release);
    mg_wakeup(&mgr_, 0, nullptr, 0);
    if (worker_.joinable())
    {
        ROTOR_LOG_INFO("Stopping RPC worker thread");
        worker_.join();
    }
    if (listener_ != nullptr)
    {
        listener_->is_closing = 1;
        listener_ = nullptr;
    }
}

std::uint16_t Server::port() const noexcept
{
    return port_.load(std::memory_order_acquire);
}

void Server::run_loop()
{
    while (running_.load(std::memory_order_acquire) &&
           !rotor::runtime::should_shutdown())
    {
        mg_mgr_poll(&mgr_, kPollIntervalMs);
        process_pending_tasks();
    }
    running_.store(false, std::memory_order_release);
}

void Server::handle_event(struct mg_connection *conn, int ev, void *ev_data)
{
    if (conn == nullptr)
    {
        return;
    }
    auto *self = static_cast<Server *>(conn->fn_data);
    if (self == nullptr || self->destroying_.load(std::memory_order_acquire))
    {
        return;
    }

    switch (ev)
    {
    case MG_EV_HTTP_MSG:
        self->handle_http_message(
            conn, static_cast<struct mg_http_message *>(ev_data));
        break;
    case MG_EV_WS_OPEN:
        self->ws_clients_.push_back(conn);
        break;
    case MG_EV_WS_MSG:
        // event stream is one-way
        break;
    case MG_EV_CLOSE:
        self->handle_connection_closed(conn);
        break;
    default:
        break;
    }
}

bool Server::host_allowed(struct mg_http_message *hm) const
{
    if (!loopback_only_)
    {
        return true;
    }
    // DNS rebinding: a loopback listener only answers loopback Host headers
    auto host = header_value(hm, "Host");
    return host && rotor::net::is_loopback_host(*host);
}

bool Server::authorize_request(struct mg_http_message *hm) const
{
    if (!options_.token)
    {
        return true;
    }
    auto const &token = *options_.token;
    if (auto value = header_value(hm, options_.token_header.c_str());
        value && *value == token)
    {
        return true;
    }
    if (auto value = header_value(hm, "Authorization"))
    {
        static constexpr std::string_view bearer = "Bearer ";
        if (value->starts_with(bearer) && value->substr(bearer.size()) == token)
        {
            return true;
        }
    }
    return false;
}

void Server::handle_http_message(struct mg_connection *conn,
                                 struct mg_http_message *hm)
{
    if (hm == nullptr)
    {
        return;
    }
    auto uri = to_view(hm->uri);
    auto method = to_view(hm->method);
    ROTOR_LOG_DEBUG("HTTP request {} {}", method, uri);

    bool is_rpc = uri == options_.rpc_path;
    bool is_ws = uri == options_.ws_path;
    if (!is_rpc && !is_ws)
    {
        mg_http_reply(conn, 404, "Content-Type: text/plain\r\n", "not found");
        return;
    }
    if (!host_allowed(hm))
    {
        ROTOR_LOG_INFO("HTTP request rejected; unsupported host header");
        mg_http_reply(conn, 403, kJsonHeaders, "%s",
                      serialize_error("invalid host header").c_str());
        return;
    }

    if (is_ws)
    {
        bool authorized = authorize_request(hm);
        if (!authorized && options_.token)
        {
            authorized = query_token(hm) == options_.token;
        }
        if (!authorized)
        {
            mg_http_reply(conn, 401, "Content-Type: text/plain\r\n",
                          "unauthorized");
            return;
        }
        mg_ws_upgrade(conn, hm, nullptr);
        return;
    }

    if (method != "POST")
    {
        mg_http_reply(conn, 405, "Allow: POST\r\nContent-Type: text/plain\r\n",
                      "method not allowed");
        return;
    }
    if (!authorize_request(hm))
    {
        ROTOR_LOG_INFO("RPC request rejected; bad or missing token");
        mg_http_reply(conn, 401, "Content-Type: text/plain\r\n",
                      "unauthorized");
        return;
    }
    if (hm->body.len > kMaxHttpPayloadSize)
    {
        ROTOR_LOG_INFO("RPC payload too large: {} bytes", hm->body.len);
        mg_http_reply(conn, 413, kJsonHeaders, "%s",
                      serialize_error("payload too large").c_str());
        return;
    }

    std::string body;
    if (hm->body.len > 0 && hm->body.buf != nullptr)
    {
        body.assign(hm->body.buf, hm->body.len);
    }
    auto req_id = next_request_id_++;
    active_requests_[req_id] = {conn};
    dispatcher_.dispatch(body,
                         [this, req_id](std::string response)
                         {
                             enqueue_task(
                                 [this, req_id, response = std::move(response)]
                                 { send_response(req_id, response); });
                         });
}

void Server::handle_connection_closed(struct mg_connection *conn)
{
    ws_clients_.erase(
        std::remove(ws_clients_.begin(), ws_clients_.end(), conn),
        ws_clients_.end());
    for (auto it = active_requests_.begin(); it != active_requests_.end();)
    {
        if (it->second.conn == conn)
        {
            it = active_requests_.erase(it);
        }
        else
        {
            ++it;
        }
    }
}

void Server::enqueue_task(std::function<void()> task)
{
    {
        std::lock_guard<std::mutex> lock(tasks_mtx_);
        pending_tasks_.push_back(std::move(task));
    }
    mg_wakeup(&mgr_, 0, nullptr, 0);
}

void Server::process_pending_tasks()
{
    std::vector<std::function<void()>> tasks;
    {
        std::lock_guard<std::mutex> lock(tasks_mtx_);
        tasks.swap(pending_tasks_);
    }
    for (auto &task : tasks)
    {
        try
        {
            task();
        }
        catch (std::exception const &ex)
        {
            ROTOR_LOG_ERROR("RPC task failed: {}", ex.what());
        }
    }
}

void Server::send_response(std::uint64_t req_id, std::string const &response)
{
    auto it = active_requests_.find(req_id);
    if (it == active_requests_.end())
    {
        // client went away first
        return;
    }
    mg_http_reply(it->second.conn, 200, kJsonHeaders, "%s", response.c_str());
    active_requests_.erase(it);
}

void Server::broadcast(std::string const &payload)
{
    for (auto *conn : ws_clients_)
    {
        mg_ws_send(conn, payload.data(), payload.size(), WEBSOCKET_OP_TEXT);
    }
}

} // namespace rotor::rpc
