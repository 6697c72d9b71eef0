#include "storage/storage.hpp"

#include "utils/logging.hpp"
#include "utils/strings.hpp"


// -------------------- ctor / init --------------------

Storage::Storage(const std::string& db_path)
  : db_(db_path.c_str(),
        SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE | SQLite::OPEN_FULLMUTEX)
{
  db_.setBusyTimeout(5000); // ms
}

void Storage::init() {
  db_.exec("PRAGMA journal_mode=WAL;");
  db_.exec("PRAGMA synchronous=NORMAL;");

  create_schema_();
}

void Storage::create_schema_() {
  db_.exec(R"SQL(
CREATE TABLE IF NOT EXISTS instruments (
  symbol              TEXT PRIMARY KEY,
  price_precision     INTEGER NOT NULL CHECK (price_precision BETWEEN 0 AND 9),
  size_precision      INTEGER NOT NULL CHECK (size_precision BETWEEN 0 AND 9)
);
)SQL");
}

// -------------------- writes --------------------

bool Storage::upsert_instrument(const Instrument& inst)
{
  check_precision(inst.price_precision);
  check_precision(inst.size_precision);

  try {
    SQLite::Transaction txn(db_);
    SQLite::Statement stmt(db_,
      "INSERT INTO instruments(symbol, price_precision, size_precision) VALUES (?,?,?) "
      "ON CONFLICT(symbol) DO UPDATE SET "
      "price_precision=excluded.price_precision, size_precision=excluded.size_precision");

    stmt.bind(1, normalize_symbol(inst.symbol));
    stmt.bind(2, static_cast<int>(inst.price_precision));
    stmt.bind(3, static_cast<int>(inst.size_precision));

    stmt.exec();
    txn.commit();
    return true;
  } catch (const SQLite::Exception& e) {
    log_stream(LogLevel::Error) << "[STORAGE] upsert_instrument failed symbol=" << inst.symbol << " : " << e.what() << "\n";
    return false;
  }
}

// -------------------- reads --------------------

std::optional<Instrument> Storage::find_instrument(const std::string& symbol) const
{
  try {
    SQLite::Statement q(db_,
      "SELECT symbol, price_precision, size_precision FROM instruments WHERE symbol=?");
    q.bind(1, normalize_symbol(symbol));

    if (q.executeStep()) {
      return Instrument{q.getColumn(0).getString(),
                        static_cast<uint8_t>(q.getColumn(1).getInt()),
                        static_cast<uint8_t>(q.getColumn(2).getInt())};
    }
    return std::nullopt;
  } catch (const SQLite::Exception& e) {
    log_stream(LogLevel::Error) << "[STORAGE] find_instrument failed symbol=" << symbol << " : " << e.what() << "\n";
    return std::nullopt;
  }
}

std::vector<Instrument> Storage::list_instruments() const
{
  std::vector<Instrument> out;
  try {
    SQLite::Statement q(db_,
      "SELECT symbol, price_precision, size_precision FROM instruments ORDER BY symbol");

    while (q.executeStep()) {
      out.push_back(Instrument{q.getColumn(0).getString(),
                               static_cast<uint8_t>(q.getColumn(1).getInt()),
                               static_cast<uint8_t>(q.getColumn(2).getInt())});
    }
  } catch (const SQLite::Exception& e) {
    log_stream(LogLevel::Error) << "[STORAGE] list_instruments failed : " << e.what() << "\n";
    out.clear();
  }
  return out;
}
