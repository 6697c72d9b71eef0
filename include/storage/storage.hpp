#pragma once

#include "domain/instrument.hpp"

#include <SQLiteCpp/SQLiteCpp.h>
#include <optional>
#include <string>
#include <vector>

// Instrument precision registry backed by SQLite (via SQLiteCpp).
// Notes:
//  - Call init() once after construction to set pragmas and create tables.
//  - Writes return bool on success; reads return empty results on failure.
//    Database exceptions never escape either.
class Storage {
public:
  // Opens (or creates) the database file.
  // Thread-safe mode: OPEN_FULLMUTEX; you should still serialize writes at the app level.
  explicit Storage(const std::string& db_path);

  // PRAGMAs + schema creation.
  void init();

  // Insert or replace by symbol. Throws InvalidPrecision before touching the DB.
  bool upsert_instrument(const Instrument& inst);

  std::optional<Instrument> find_instrument(const std::string& symbol) const;

  // Ordered by symbol.
  std::vector<Instrument> list_instruments() const;

private:
  void create_schema_();

private:
  SQLite::Database db_;
};
