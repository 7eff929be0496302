#pragma once

#include <ostream>
#include <string>

// Each returns the process exit code. Results go to out; diagnostics go to err.
int execute_encode(const std::string& decimal_id, std::ostream& out, std::ostream& err);
int execute_decode(const std::string& text, std::ostream& out, std::ostream& err);
int execute_inspect(const std::string& id_or_text, std::ostream& out, std::ostream& err);
