/**
 * @file grpc_host.cpp
 * @brief Callback-API generic gRPC server fed from a transport::Listener.
 */
#include "csimux/rpc/grpc_host.hpp"

#include <chrono>
#include <mutex>
#include <system_error>
#include <thread>
#include <vector>

#include <grpcpp/server_builder.h>
#include <grpcpp/server_posix.h>

namespace csimux::rpc {

// One inbound call. Reads the single request, then hands off to a worker thread.
class GrpcHost::Reactor final : public grpc::ServerGenericBidiReactor {
public:
    Reactor(GrpcHost& host, grpc::GenericCallbackServerContext* sctx)
        : host_(host), sctx_(sctx), call_(sctx) {
        host_.track(this);
        StartRead(&request_);
    }

    void OnReadDone(bool ok) override {
        if (!ok) {
            Finish(grpc::Status(grpc::StatusCode::INTERNAL, "request message missing"));
            return;
        }
        host_.launch(this);
    }

    void OnCancel() override { call_.cancel(); }

    void OnDone() override {
        {
            std::lock_guard<std::recursive_mutex> lk(cancel_mu_);
            finished_ = true;
        }
        if (host_.untrack(this)) delete this;
    }

    /// TryCancel unless gRPC already finished the call (sctx_ is gone after OnDone).
    void try_cancel() {
        std::lock_guard<std::recursive_mutex> lk(cancel_mu_);
        if (!finished_) sctx_->TryCancel();
    }

    GrpcHost&                            host_;
    int                                  pins_{0};     // guarded by host_.mu_
    bool                                 done_{false}; // guarded by host_.mu_
    std::recursive_mutex                 cancel_mu_;   // reentered when reactions run inline
    bool                                 finished_{false};
    grpc::GenericCallbackServerContext*  sctx_;
    CallContext                          call_;
    grpc::ByteBuffer                     request_;
    grpc::ByteBuffer                     response_;
};

class GrpcHost::Generic final : public grpc::CallbackGenericService {
public:
    explicit Generic(GrpcHost& host) : host_(host) {}

    grpc::ServerGenericBidiReactor* CreateReactor(grpc::GenericCallbackServerContext* ctx) override {
        return new Reactor(host_, ctx);
    }

private:
    GrpcHost& host_;
};

GrpcHost::GrpcHost(Resolver resolver)
    : resolver_(std::move(resolver)), generic_(std::make_unique<Generic>(*this)) {}

GrpcHost::~GrpcHost() { stop(); }

Result<void> GrpcHost::serve(transport::Listener& lis) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (state_ == State::Serving) {
            return make_error(ErrorCode::ServerStarted, "already serving on " + lis.address());
        }
        if (state_ != State::Idle) {
            return make_error(ErrorCode::ServerStopped, "stopped before serving " + lis.address());
        }
        grpc::ServerBuilder builder;
        builder.RegisterCallbackGenericService(generic_.get());
        server_ = builder.BuildAndStart();
        if (!server_) {
            state_ = State::Stopped;
            return make_error(ErrorCode::ListenFailed, "gRPC server failed to start");
        }
        listener_ = &lis;
        state_ = State::Serving;
    }

    Result<void> outcome{};
    for (;;) {
        auto conn = lis.accept();
        if (!conn) {
            if (conn.error().code != ErrorCode::Closed) {
                outcome = csimux_detail::unexpected<Error>(conn.error());
            }
            break;
        }
        if (!conn->set_nonblocking(true)) continue; // drop the connection

        std::lock_guard<std::mutex> lk(mu_);
        if (state_ != State::Serving) break;
        grpc::AddInsecureChannelFromFd(server_.get(), conn->release());
    }

    // Listener closed from outside or failed: drain what was accepted.
    bool self_stop = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        self_stop = state_ == State::Serving;
    }
    if (self_stop) graceful_stop();

    server_->Wait();
    {
        std::lock_guard<std::mutex> lk(mu_);
        state_ = State::Stopped;
        listener_ = nullptr;
    }
    return outcome;
}

void GrpcHost::stop() { begin_stop(true); }

void GrpcHost::graceful_stop() { begin_stop(false); }

void GrpcHost::begin_stop(bool forced) {
    transport::Listener* lis = nullptr;
    grpc::Server* srv = nullptr;
    std::vector<Reactor*> doomed;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (state_ == State::Idle) {
            state_ = State::Stopped;
            return;
        }
        if (state_ == State::Serving) state_ = State::Stopping;
        lis = listener_;
        if (!shutdown_issued_ && server_) {
            shutdown_issued_ = true;
            srv = server_.get();
        }
        if (forced) {
            doomed.reserve(active_.size());
            for (Reactor* r : active_) {
                r->call_.cancel();
                ++r->pins_;
                doomed.push_back(r);
            }
        }
    }

    // Cancel outside mu_: gRPC may run the reactions inline. Pinned reactors stay
    // alive until released here.
    for (Reactor* r : doomed) r->try_cancel();
    for (Reactor* r : doomed) release(r);

    if (lis) lis->close();
    if (srv) {
        if (forced) {
            srv->Shutdown(std::chrono::system_clock::now());
        } else {
            srv->Shutdown();
        }
    }
    wait_idle();
}

GrpcHost::State GrpcHost::state() const {
    std::lock_guard<std::mutex> lk(mu_);
    return state_;
}

std::size_t GrpcHost::in_flight() const {
    std::lock_guard<std::mutex> lk(mu_);
    return active_.size();
}

void GrpcHost::track(Reactor* r) {
    std::lock_guard<std::mutex> lk(mu_);
    active_.insert(r);
}

bool GrpcHost::untrack(Reactor* r) {
    std::lock_guard<std::mutex> lk(mu_);
    active_.erase(r);
    r->done_ = true;
    return r->pins_ == 0;
}

void GrpcHost::release(Reactor* r) {
    bool last = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        last = --r->pins_ == 0 && r->done_;
    }
    if (last) delete r;
}

void GrpcHost::launch(Reactor* r) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        ++workers_;
    }
    try {
        std::thread([this, r] { run_call(r); }).detach();
    } catch (const std::system_error& e) {
        {
            std::lock_guard<std::mutex> lk(mu_);
            --workers_;
            idle_cv_.notify_all();
        }
        r->Finish(grpc::Status(grpc::StatusCode::RESOURCE_EXHAUSTED, e.what()));
    }
}

void GrpcHost::run_call(Reactor* r) {
    grpc::Status st;
    const MethodEntry* method = find_method(r->sctx_->method());
    if (!method) {
        st = grpc::Status(grpc::StatusCode::UNIMPLEMENTED, "unknown method " + r->sctx_->method());
    } else if (ProtocolHandler* h = resolver_(r->call_, *method); !h) {
        st = grpc::Status(grpc::StatusCode::UNAVAILABLE, "no handler for " + r->sctx_->method());
    } else {
        st = method->invoke(*h, r->call_, &r->request_, &r->response_);
    }

    if (st.ok()) {
        r->StartWriteAndFinish(&r->response_, grpc::WriteOptions(), st);
    } else {
        r->Finish(st);
    }

    std::lock_guard<std::mutex> lk(mu_);
    --workers_;
    idle_cv_.notify_all();
}

void GrpcHost::wait_idle() {
    std::unique_lock<std::mutex> lk(mu_);
    idle_cv_.wait(lk, [this] { return workers_ == 0; });
}

} // namespace csimux::rpc
