/**
* @file observability.cpp
 * @brief Basic stderr-backed implementation of Observer.
 */
#include "csimux/obs/observability.hpp"
#include <mutex>
#include <cstdio>

namespace csimux::obs {

    class SimpleObserver : public Observer {
    public:
        void record(const RouteEvent& e) override {
            std::lock_guard<std::mutex> lk(mu_);
            ctr_.routed++;
            if (e.defaulted) ctr_.routed_default++;
            std::fprintf(stderr,
              R"({"event":"route","method":"%s","type":"%s","service":"%s","defaulted":%s})" "\n",
              e.method.c_str(), e.service_type.c_str(), e.service_name.c_str(),
              e.defaulted ? "true" : "false");
            std::fflush(stderr);
        }
        void record(const RejectEvent& e) override {
            std::lock_guard<std::mutex> lk(mu_);
            ctr_.rejected++;
            std::fprintf(stderr,
              R"({"event":"reject","service":"%s","method":"%s","reason":"%s"})" "\n",
              e.service_name.c_str(), e.method.c_str(), e.reason.c_str());
            std::fflush(stderr);
        }
        void record(const LifecycleEvent& e) override {
            std::lock_guard<std::mutex> lk(mu_);
            ctr_.lifecycle++;
            std::fprintf(stderr,
              R"({"event":"lifecycle","component":"%s","name":"%s","action":"%s","detail":"%s"})" "\n",
              e.component.c_str(), e.name.c_str(), e.action.c_str(), e.detail.c_str());
            std::fflush(stderr);
        }
        Counters snapshot() const override {
            std::lock_guard<std::mutex> lk(mu_);
            return ctr_;
        }
    private:
        mutable std::mutex mu_;
        Counters ctr_;
    };

    Observer* make_simple_observer() {
        static SimpleObserver obs; // process-wide singleton
        return &obs;
    }

} // namespace csimux::obs
