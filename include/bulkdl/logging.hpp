#pragma once

namespace bulkdl {

// Installs the "bulkdl" stderr logger as the spdlog default and registers the
// "libcurl" logger used for transfer traces. Safe to call more than once.
void setupLogging(bool verbose);

} // namespace bulkdl
