#include "venue/ws_transport.hpp"

#include "venue/errors.hpp"
#include "venue/util.hpp"

#include <libwebsockets.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

namespace venue {

struct WsTransport::Impl {
    std::string url;
    WsEndpoint endpoint;
    ::lws_context* context = nullptr;
    ::lws* wsi = nullptr;
    std::thread service_thread;
    std::atomic<bool> should_stop{false};
    std::atomic<bool> open{false};
    std::atomic<bool> close_reported{false};

    TransportHandlers handlers;

    std::size_t max_queued_frames = 256;
    std::mutex send_mutex;
    std::condition_variable send_cv;
    std::deque<std::string> send_queue;
    std::string message_buffer;

    template <typename Fn>
    void guarded(const char* what, Fn&& fn) {
        // Never let a handler exception unwind through libwebsockets.
        try {
            fn();
        } catch (const std::exception& ex) {
            spdlog::error("[WS] {} handler threw: {}", what, ex.what());
        }
    }

    void report_close(const std::string& reason) {
        open = false;
        send_cv.notify_all();
        if (should_stop || close_reported.exchange(true)) {
            return;
        }
        if (handlers.on_close) {
            guarded("close", [&] { handlers.on_close(reason); });
        }
    }
};

} // namespace venue

namespace {

int callback_ws_client(struct lws* wsi, enum lws_callback_reasons reason,
                       void* /*user*/, void* in, size_t len) {
    auto* impl = static_cast<venue::WsTransport::Impl*>(lws_get_opaque_user_data(wsi));
    if (!impl) {
        auto* context = lws_get_context(wsi);
        impl = context ? static_cast<venue::WsTransport::Impl*>(lws_context_user(context)) : nullptr;
        if (!impl) {
            return 0;
        }
    }

    switch (reason) {
        case LWS_CALLBACK_CLIENT_ESTABLISHED: {
            impl->open = true;
            if (impl->handlers.on_open) {
                impl->guarded("open", [&] { impl->handlers.on_open(); });
            }
            break;
        }

        case LWS_CALLBACK_CLIENT_CONNECTION_ERROR: {
            const std::string error = in ? std::string(static_cast<const char*>(in), len) : "connection error";
            if (!impl->should_stop && impl->handlers.on_error) {
                impl->guarded("error", [&] { impl->handlers.on_error(error); });
            }
            impl->wsi = nullptr;
            impl->report_close(error);
            break;
        }

        case LWS_CALLBACK_CLIENT_CLOSED:
        case LWS_CALLBACK_CLOSED: {
            impl->wsi = nullptr;
            impl->report_close("connection closed by peer");
            break;
        }

        case LWS_CALLBACK_CLIENT_RECEIVE: {
            if (in && len > 0) {
                impl->message_buffer.append(static_cast<const char*>(in), len);
            }
            if (lws_is_final_fragment(wsi)) {
                if (!lws_frame_is_binary(wsi) && impl->handlers.on_frame) {
                    impl->guarded("frame", [&] { impl->handlers.on_frame(impl->message_buffer); });
                }
                impl->message_buffer.clear();
            }
            break;
        }

        case LWS_CALLBACK_CLIENT_WRITEABLE: {
            std::string frame;
            bool more = false;
            {
                std::lock_guard<std::mutex> lock(impl->send_mutex);
                if (impl->send_queue.empty()) {
                    break;
                }
                frame = std::move(impl->send_queue.front());
                impl->send_queue.pop_front();
                more = !impl->send_queue.empty();
            }
            impl->send_cv.notify_all();

            std::vector<unsigned char> buf(LWS_PRE + frame.size());
            std::memcpy(buf.data() + LWS_PRE, frame.data(), frame.size());
            const int n = lws_write(wsi, buf.data() + LWS_PRE, frame.size(), LWS_WRITE_TEXT);
            if (n < static_cast<int>(frame.size())) {
                if (impl->handlers.on_error) {
                    impl->guarded("error", [&] { impl->handlers.on_error("failed to write websocket frame"); });
                }
                return -1;
            }
            if (more) {
                lws_callback_on_writable(wsi);
            }
            break;
        }

        case LWS_CALLBACK_EVENT_WAIT_CANCELLED: {
            // send() wakes the service loop; request a writeable callback from here.
            bool pending = false;
            {
                std::lock_guard<std::mutex> lock(impl->send_mutex);
                pending = !impl->send_queue.empty();
            }
            if (pending && impl->wsi && impl->open) {
                lws_callback_on_writable(impl->wsi);
            }
            break;
        }

        default:
            break;
    }

    return 0;
}

const struct lws_protocols protocols[] = {
    {
        "gridbot-stream",
        callback_ws_client,
        0,
        65536, // rx_buffer_size
    },
    {nullptr, nullptr, 0, 0}
};

} // anonymous namespace

namespace venue {

WsTransport::WsTransport(std::size_t max_queued_frames)
    : pimpl_(std::make_unique<Impl>()) {
    pimpl_->max_queued_frames = max_queued_frames == 0 ? 1 : max_queued_frames;
}

WsTransport::~WsTransport() {
    close();
}

void WsTransport::open(const std::string& url, TransportHandlers handlers) {
    if (pimpl_->context) {
        throw TransportError("transport already opened");
    }

    const auto endpoint = parse_ws_url(url);
    if (!endpoint) {
        throw TransportError("unsupported websocket url: " + url);
    }

    pimpl_->url = url;
    pimpl_->endpoint = *endpoint;
    pimpl_->handlers = std::move(handlers);
    pimpl_->should_stop = false;
    pimpl_->close_reported = false;

    lws_set_log_level(LLL_ERR | LLL_WARN, nullptr);

    struct lws_context_creation_info info;
    std::memset(&info, 0, sizeof(info));
    info.port = CONTEXT_PORT_NO_LISTEN;
    info.protocols = protocols;
    info.gid = -1;
    info.uid = -1;
    info.options = LWS_SERVER_OPTION_DO_SSL_GLOBAL_INIT;
    info.user = pimpl_.get();

    pimpl_->context = lws_create_context(&info);
    if (!pimpl_->context) {
        throw TransportError("failed to create libwebsockets context");
    }

    struct lws_client_connect_info ccinfo;
    std::memset(&ccinfo, 0, sizeof(ccinfo));
    ccinfo.context = pimpl_->context;
    ccinfo.address = pimpl_->endpoint.host.c_str();
    ccinfo.port = pimpl_->endpoint.port;
    ccinfo.path = pimpl_->endpoint.path.c_str();
    ccinfo.host = pimpl_->endpoint.host.c_str();
    ccinfo.origin = pimpl_->endpoint.host.c_str();
    ccinfo.protocol = protocols[0].name;
    ccinfo.ssl_connection = pimpl_->endpoint.ssl ? LCCSCF_USE_SSL : 0;

    pimpl_->wsi = lws_client_connect_via_info(&ccinfo);
    if (!pimpl_->wsi) {
        lws_context_destroy(pimpl_->context);
        pimpl_->context = nullptr;
        throw TransportError("failed to start connection to " + url);
    }
    lws_set_opaque_user_data(pimpl_->wsi, pimpl_.get());

    pimpl_->service_thread = std::thread([impl = pimpl_.get()]() {
        while (!impl->should_stop) {
            if (lws_service(impl->context, 0) < 0) {
                break;
            }
        }
    });
}

bool WsTransport::send(const std::string& frame, std::chrono::milliseconds timeout) {
    if (!pimpl_->open || !pimpl_->context) {
        return false;
    }

    {
        std::unique_lock<std::mutex> lock(pimpl_->send_mutex);
        const bool has_room = pimpl_->send_cv.wait_for(lock, timeout, [this] {
            return pimpl_->send_queue.size() < pimpl_->max_queued_frames || !pimpl_->open;
        });
        if (!has_room || !pimpl_->open) {
            return false;
        }
        pimpl_->send_queue.push_back(frame);
    }

    lws_cancel_service(pimpl_->context);
    return true;
}

void WsTransport::close() {
    pimpl_->should_stop = true;
    pimpl_->open = false;
    pimpl_->send_cv.notify_all();

    if (pimpl_->context) {
        lws_cancel_service(pimpl_->context);
    }

    if (pimpl_->service_thread.joinable()) {
        pimpl_->service_thread.join();
    }

    if (pimpl_->context) {
        lws_context_destroy(pimpl_->context);
        pimpl_->context = nullptr;
    }

    pimpl_->wsi = nullptr;
    {
        std::lock_guard<std::mutex> lock(pimpl_->send_mutex);
        pimpl_->send_queue.clear();
    }
    pimpl_->message_buffer.clear();
}

bool WsTransport::is_open() const noexcept {
    return pimpl_->open;
}

} // namespace venue
