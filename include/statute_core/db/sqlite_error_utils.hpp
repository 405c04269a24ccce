#pragma once

#include <sqlite_modern_cpp.h>

#include <string>

namespace statute_core {

enum class DbErrorKind { BusyOrLocked, Constraint, Readonly, Io, CantOpen, Full, Schema, Generic };

DbErrorKind classify_sqlite_code(int primary_code);
std::string kind_to_string(DbErrorKind kind);

// "<operation> failed: (<kind>) <message> [code=N, xcode=N]"
std::string format_db_error(const std::string& operation, const sqlite::sqlite_exception& e);

}  // namespace statute_core
