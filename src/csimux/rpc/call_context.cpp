/**
 * @file call_context.cpp
 * @brief CallContext implementation.
 */
#include "csimux/rpc/call_context.hpp"

namespace csimux::rpc {

CallContext::Child::Child(CallContext& parent, std::unique_ptr<grpc::ClientContext> client)
    : parent_(parent), client_(std::move(client)) {
    parent_.attach(client_.get());
}

CallContext::Child::~Child() { parent_.detach(client_.get()); }

std::optional<std::string> CallContext::metadata(std::string_view key) const {
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = overrides_.find(std::string(key));
        if (it != overrides_.end()) return it->second;
    }
    if (!server_) return std::nullopt;
    const auto& md = server_->client_metadata();
    auto it = md.find(grpc::string_ref(key.data(), key.size()));
    if (it == md.end()) return std::nullopt;
    return std::string(it->second.data(), it->second.size());
}

void CallContext::set_metadata(std::string key, std::string value) {
    std::lock_guard<std::mutex> lk(mu_);
    overrides_[std::move(key)] = std::move(value);
}

void CallContext::set_deadline(std::chrono::system_clock::time_point deadline) {
    std::lock_guard<std::mutex> lk(mu_);
    deadline_ = deadline;
}

std::optional<std::chrono::system_clock::time_point> CallContext::deadline() const {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (deadline_) return deadline_;
    }
    if (!server_) return std::nullopt;
    auto d = server_->deadline();
    if (d == std::chrono::system_clock::time_point::max()) return std::nullopt;
    return d;
}

bool CallContext::cancelled() const {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (cancelled_) return true;
    }
    return server_ && server_->IsCancelled();
}

bool CallContext::wait_cancelled_for(std::chrono::milliseconds d) const {
    std::unique_lock<std::mutex> lk(mu_);
    return cv_.wait_for(lk, d, [this] { return cancelled_; });
}

void CallContext::cancel() {
    std::lock_guard<std::mutex> lk(mu_);
    if (cancelled_) return;
    cancelled_ = true;
    for (grpc::ClientContext* c : children_) c->TryCancel();
    cv_.notify_all();
}

std::unique_ptr<CallContext::Child> CallContext::child() {
    std::unique_ptr<grpc::ClientContext> cc;
    if (server_) {
        cc = grpc::ClientContext::FromCallbackServerContext(*server_);
    } else {
        cc = std::make_unique<grpc::ClientContext>();
    }
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (deadline_) cc->set_deadline(*deadline_);
    }
    return std::unique_ptr<Child>(new Child(*this, std::move(cc)));
}

void CallContext::attach(grpc::ClientContext* c) {
    std::lock_guard<std::mutex> lk(mu_);
    children_.insert(c);
    if (cancelled_) c->TryCancel();
}

void CallContext::detach(grpc::ClientContext* c) {
    std::lock_guard<std::mutex> lk(mu_);
    children_.erase(c);
}

} // namespace csimux::rpc
