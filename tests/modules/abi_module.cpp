/**
 * @file abi_module.cpp
 * @brief Test module built against a future table layout.
 */
#include "csimux/config/constants.hpp"
#include "csimux/provider/module_abi.hpp"

namespace {

const csimux_provider_table kTable = {csimux::config::constants::PROVIDER_ABI_VERSION + 1, 0, nullptr};

} // namespace

extern "C" __attribute__((visibility("default")))
const csimux_provider_table* csimux_service_providers() { return &kTable; }
