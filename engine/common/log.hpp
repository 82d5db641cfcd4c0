#pragma once

namespace gridduel {

// Diagnostic lines on std::cerr. Enabled by GRIDDUEL_LOG or set_log_enabled().
bool log_enabled();
void set_log_enabled(bool on);

} // namespace gridduel
