/**
 * @file mock_module.cpp
 * @brief Loadable-module entry point exporting the mock provider.
 */
#include "csimux/config/constants.hpp"
#include "csimux/provider/module_abi.hpp"
#include "csimux/providers/mock_provider.hpp"

namespace {

csimux::provider::ServiceProvider* create_mock() {
    return new csimux::providers::MockProvider();
}

const csimux_provider_entry kEntries[] = {
    {csimux::config::constants::MOCK_PROVIDER_NAME, &create_mock},
};

const csimux_provider_table kTable = {
    csimux::config::constants::PROVIDER_ABI_VERSION,
    sizeof(kEntries) / sizeof(kEntries[0]),
    kEntries,
};

} // namespace

extern "C" __attribute__((visibility("default")))
const csimux_provider_table* csimux_service_providers() {
    return &kTable;
}
