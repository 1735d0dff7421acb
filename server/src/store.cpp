#include "drcv/server/store.hpp"

#include <sqlite3.h>

#include <spdlog/spdlog.h>

namespace drcv::server
{

    StoreError::StoreError(std::string message) : std::runtime_error(std::move(message)) {}

    namespace
    {
        using protocol::ClientRecord;
        using protocol::ClientStatus;
        using protocol::Timestamp;
        using protocol::UploadRecord;
        using protocol::UploadStatus;

        constexpr auto kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS uploads (
    id             INTEGER PRIMARY KEY AUTOINCREMENT,
    filename       TEXT NOT NULL,
    client_address TEXT NOT NULL,
    size           INTEGER NOT NULL DEFAULT 0,
    status         TEXT NOT NULL,
    created_at     INTEGER NOT NULL,
    updated_at     INTEGER NOT NULL,
    completed_at   INTEGER
);

CREATE UNIQUE INDEX IF NOT EXISTS idx_uploads_active_key
    ON uploads(client_address, filename) WHERE status IN ('init', 'uploading');

CREATE INDEX IF NOT EXISTS idx_uploads_status_updated
    ON uploads(status, updated_at);

CREATE TABLE IF NOT EXISTS clients (
    address    TEXT PRIMARY KEY,
    user_agent TEXT NOT NULL DEFAULT '',
    status     TEXT NOT NULL,
    last_seen  INTEGER NOT NULL
);

CREATE TABLE IF NOT EXISTS kv (
    key        TEXT PRIMARY KEY,
    value      TEXT NOT NULL,
    updated_at INTEGER NOT NULL
);
)SQL";

        constexpr auto kUploadColumns =
            "id, filename, client_address, size, status, created_at, updated_at, completed_at";

        constexpr auto kClientColumns = "address, user_agent, status, last_seen";

        // Prepared statement owned for the duration of one store call.
        class Statement
        {
        public:
            Statement(sqlite3 *db, const std::string &sql) : db_(db)
            {
                if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK)
                {
                    throw StoreError(std::string("prepare failed: ") + sqlite3_errmsg(db_));
                }
            }

            ~Statement()
            {
                sqlite3_finalize(stmt_);
            }

            Statement(const Statement &) = delete;
            Statement &operator=(const Statement &) = delete;

            void bind(int index, const std::string &value)
            {
                check(sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
            }

            void bind(int index, std::string_view value)
            {
                check(sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
            }

            void bind(int index, std::int64_t value)
            {
                check(sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)));
            }

            void bind(int index, Timestamp value)
            {
                bind(index, protocol::to_unix_millis(value));
            }

            // True while a row is available.
            bool step()
            {
                const int rc = sqlite3_step(stmt_);
                if (rc == SQLITE_ROW)
                {
                    return true;
                }
                if (rc == SQLITE_DONE)
                {
                    return false;
                }
                throw StoreError(std::string("step failed: ") + sqlite3_errmsg(db_));
            }

            void run()
            {
                while (step())
                {
                }
            }

            std::int64_t column_int64(int column) const
            {
                return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, column));
            }

            std::string column_text(int column) const
            {
                const auto *text = sqlite3_column_text(stmt_, column);
                if (text == nullptr)
                {
                    return {};
                }
                return std::string(reinterpret_cast<const char *>(text),
                                   static_cast<std::size_t>(sqlite3_column_bytes(stmt_, column)));
            }

            bool column_is_null(int column) const
            {
                return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
            }

            Timestamp column_time(int column) const
            {
                return protocol::from_unix_millis(column_int64(column));
            }

        private:
            void check(int rc)
            {
                if (rc != SQLITE_OK)
                {
                    throw StoreError(std::string("bind failed: ") + sqlite3_errmsg(db_));
                }
            }

            sqlite3 *db_;
            sqlite3_stmt *stmt_{nullptr};
        };

        UploadRecord read_upload(const Statement &stmt)
        {
            UploadRecord record{};
            record.id = stmt.column_int64(0);
            record.filename = stmt.column_text(1);
            record.client_address = stmt.column_text(2);
            record.size = static_cast<std::uint64_t>(stmt.column_int64(3));
            const auto status_text = stmt.column_text(4);
            const auto status = protocol::upload_status_from_string(status_text);
            if (!status)
            {
                throw StoreError("Unknown upload status in database: " + status_text);
            }
            record.status = *status;
            record.created_at = stmt.column_time(5);
            record.updated_at = stmt.column_time(6);
            if (!stmt.column_is_null(7))
            {
                record.completed_at = stmt.column_time(7);
            }
            return record;
        }

        ClientRecord read_client(const Statement &stmt)
        {
            ClientRecord record{};
            record.address = stmt.column_text(0);
            record.user_agent = stmt.column_text(1);
            const auto status_text = stmt.column_text(2);
            const auto status = protocol::client_status_from_string(status_text);
            if (!status)
            {
                throw StoreError("Unknown client status in database: " + status_text);
            }
            record.status = *status;
            record.last_seen = stmt.column_time(3);
            return record;
        }

        std::string like_pattern(const std::string &query)
        {
            std::string pattern = "%";
            for (const char c : query)
            {
                if (c == '%' || c == '_' || c == '\\')
                {
                    pattern.push_back('\\');
                }
                pattern.push_back(c);
            }
            pattern.push_back('%');
            return pattern;
        }

        std::string_view label(UploadStatus status)
        {
            return protocol::to_string(status);
        }

    } // namespace

    Store::Store(std::filesystem::path database_path, Clock clock)
        : database_path_(std::move(database_path)), clock_(std::move(clock))
    {
        if (!clock_)
        {
            clock_ = []
            { return std::chrono::system_clock::now(); };
        }
        open();
        try
        {
            init_schema();
        }
        catch (const StoreError &)
        {
            sqlite3_close(db_);
            db_ = nullptr;
            throw;
        }
        spdlog::info("Store opened at {}", database_path_.string());
    }

    Store::~Store()
    {
        if (db_ != nullptr)
        {
            sqlite3_close(db_);
        }
    }

    protocol::Timestamp Store::now() const
    {
        return clock_();
    }

    void Store::open()
    {
        const auto parent = database_path_.parent_path();
        if (!parent.empty())
        {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec)
            {
                throw StoreError("Cannot create database directory " + parent.string() + ": " + ec.message());
            }
        }
        const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
        if (sqlite3_open_v2(database_path_.string().c_str(), &db_, flags, nullptr) != SQLITE_OK)
        {
            std::string message = db_ != nullptr ? sqlite3_errmsg(db_) : "out of memory";
            if (db_ != nullptr)
            {
                sqlite3_close(db_);
                db_ = nullptr;
            }
            throw StoreError("Cannot open SQLite database " + database_path_.string() + ": " + message);
        }
        sqlite3_busy_timeout(db_, 5000);
    }

    void Store::init_schema()
    {
        char *errmsg = nullptr;
        const std::string pragmas = "PRAGMA journal_mode = WAL; PRAGMA synchronous = NORMAL;";
        if (sqlite3_exec(db_, pragmas.c_str(), nullptr, nullptr, &errmsg) != SQLITE_OK)
        {
            spdlog::warn("SQLite pragmas not applied: {}", errmsg != nullptr ? errmsg : "unknown error");
            sqlite3_free(errmsg);
            errmsg = nullptr;
        }
        if (sqlite3_exec(db_, kSchema, nullptr, nullptr, &errmsg) != SQLITE_OK)
        {
            std::string message = errmsg != nullptr ? errmsg : "unknown SQLite error";
            sqlite3_free(errmsg);
            throw StoreError("Schema migration failed: " + message);
        }
    }

    UploadLookup Store::create_or_fetch_upload(const std::string &filename, const std::string &client_address,
                                               const std::function<bool(const UploadRecord &)> &keep_completed)
    {
        std::lock_guard lock(mutex_);
        {
            // Rows are only inserted when no active one exists, so an active row is always the latest.
            Statement select(db_, std::string("SELECT ") + kUploadColumns +
                                      " FROM uploads WHERE client_address = ?1 AND filename = ?2"
                                      " ORDER BY id DESC LIMIT 1");
            select.bind(1, client_address);
            select.bind(2, filename);
            if (select.step())
            {
                auto latest = read_upload(select);
                if (!protocol::is_terminal(latest.status) ||
                    (latest.status == UploadStatus::Complete && keep_completed && keep_completed(latest)))
                {
                    return {.upload = std::move(latest), .created = false};
                }
            }
        }

        const auto now = clock_();
        Statement insert(db_, "INSERT INTO uploads(filename, client_address, size, status, created_at, updated_at)"
                              " VALUES(?1, ?2, 0, 'init', ?3, ?3)");
        insert.bind(1, filename);
        insert.bind(2, client_address);
        insert.bind(3, now);
        insert.run();

        UploadRecord record{};
        record.id = static_cast<std::int64_t>(sqlite3_last_insert_rowid(db_));
        record.filename = filename;
        record.client_address = client_address;
        record.status = UploadStatus::Init;
        record.created_at = protocol::from_unix_millis(protocol::to_unix_millis(now));
        record.updated_at = record.created_at;
        return {.upload = record, .created = true};
    }

    std::optional<protocol::UploadRecord> Store::latest_upload(const std::string &filename,
                                                               const std::string &client_address)
    {
        std::lock_guard lock(mutex_);
        Statement select(db_, std::string("SELECT ") + kUploadColumns +
                                  " FROM uploads WHERE client_address = ?1 AND filename = ?2"
                                  " ORDER BY id DESC LIMIT 1");
        select.bind(1, client_address);
        select.bind(2, filename);
        if (select.step())
        {
            return read_upload(select);
        }
        return std::nullopt;
    }

    std::optional<protocol::UploadRecord> Store::find_upload(std::int64_t id)
    {
        std::lock_guard lock(mutex_);
        return find_upload_locked(id);
    }

    std::optional<protocol::UploadRecord> Store::find_upload_locked(std::int64_t id)
    {
        Statement select(db_, std::string("SELECT ") + kUploadColumns + " FROM uploads WHERE id = ?1");
        select.bind(1, id);
        if (select.step())
        {
            return read_upload(select);
        }
        return std::nullopt;
    }

    bool Store::record_progress(std::int64_t id, std::uint64_t bytes, protocol::UploadStatus status)
    {
        if (status != UploadStatus::Uploading && status != UploadStatus::Complete)
        {
            throw std::invalid_argument("record_progress only moves uploads to uploading or complete");
        }
        std::lock_guard lock(mutex_);
        Statement update(db_, "UPDATE uploads SET size = MAX(size, ?1), status = ?2, updated_at = ?3,"
                              " completed_at = CASE WHEN ?2 = 'complete' THEN ?3 ELSE completed_at END"
                              " WHERE id = ?4 AND (status = 'uploading' OR (status = 'init' AND ?2 = 'uploading'))");
        update.bind(1, static_cast<std::int64_t>(bytes));
        update.bind(2, label(status));
        update.bind(3, clock_());
        update.bind(4, id);
        update.run();
        return sqlite3_changes(db_) > 0;
    }

    bool Store::touch_upload(std::int64_t id)
    {
        std::lock_guard lock(mutex_);
        Statement update(db_, "UPDATE uploads SET updated_at = ?1 WHERE id = ?2 AND status IN ('init', 'uploading')");
        update.bind(1, clock_());
        update.bind(2, id);
        update.run();
        return sqlite3_changes(db_) > 0;
    }

    bool Store::mark_upload_disconnected(std::int64_t id)
    {
        std::lock_guard lock(mutex_);
        Statement update(db_, "UPDATE uploads SET status = 'disconnected', updated_at = ?1"
                              " WHERE id = ?2 AND status IN ('init', 'uploading')");
        update.bind(1, clock_());
        update.bind(2, id);
        update.run();
        return sqlite3_changes(db_) > 0;
    }

    std::vector<protocol::UploadRecord> Store::active_uploads_for_client(const std::string &client_address)
    {
        std::lock_guard lock(mutex_);
        Statement select(db_, std::string("SELECT ") + kUploadColumns +
                                  " FROM uploads WHERE client_address = ?1 AND status IN ('init', 'uploading')"
                                  " ORDER BY id");
        select.bind(1, client_address);
        std::vector<UploadRecord> uploads;
        while (select.step())
        {
            uploads.push_back(read_upload(select));
        }
        return uploads;
    }

    std::vector<protocol::UploadRecord> Store::stale_uploads(protocol::Timestamp updated_before)
    {
        std::lock_guard lock(mutex_);
        Statement select(db_, std::string("SELECT ") + kUploadColumns +
                                  " FROM uploads WHERE status IN ('init', 'uploading') AND updated_at < ?1"
                                  " ORDER BY id");
        select.bind(1, updated_before);
        std::vector<UploadRecord> uploads;
        while (select.step())
        {
            uploads.push_back(read_upload(select));
        }
        return uploads;
    }

    std::vector<protocol::UploadRecord> Store::prune_uploads(protocol::Timestamp updated_before)
    {
        std::lock_guard lock(mutex_);
        std::vector<UploadRecord> pruned;
        {
            Statement select(db_, std::string("SELECT ") + kUploadColumns +
                                      " FROM uploads WHERE status IN ('complete', 'disconnected') AND updated_at < ?1"
                                      " ORDER BY id");
            select.bind(1, updated_before);
            while (select.step())
            {
                pruned.push_back(read_upload(select));
            }
        }
        for (const auto &record : pruned)
        {
            Statement remove(db_, "DELETE FROM uploads WHERE id = ?1 AND status IN ('complete', 'disconnected')");
            remove.bind(1, record.id);
            remove.run();
        }
        return pruned;
    }

    protocol::UploadPage Store::list_uploads(std::size_t page, std::size_t page_size, const std::string &query)
    {
        protocol::UploadPage result{};
        result.page = page < 1 ? 1 : page;
        result.page_size = page_size;

        const bool filtered = !query.empty();
        const std::string where =
            filtered ? " WHERE filename LIKE ?1 ESCAPE '\\' OR client_address LIKE ?1 ESCAPE '\\'" : "";
        const auto pattern = like_pattern(query);

        std::lock_guard lock(mutex_);
        {
            Statement count(db_, "SELECT COUNT(*) FROM uploads" + where);
            if (filtered)
            {
                count.bind(1, pattern);
            }
            if (count.step())
            {
                result.total = static_cast<std::uint64_t>(count.column_int64(0));
            }
        }

        const int limit_index = filtered ? 2 : 1;
        Statement select(db_, std::string("SELECT ") + kUploadColumns + " FROM uploads" + where +
                                  " ORDER BY id DESC LIMIT ?" + std::to_string(limit_index) + " OFFSET ?" +
                                  std::to_string(limit_index + 1));
        if (filtered)
        {
            select.bind(1, pattern);
        }
        select.bind(limit_index, static_cast<std::int64_t>(page_size));
        select.bind(limit_index + 1, static_cast<std::int64_t>((result.page - 1) * page_size));
        while (select.step())
        {
            result.uploads.push_back(read_upload(select));
        }
        return result;
    }

    ClientTouch Store::touch_client(const std::string &address, const std::string &user_agent)
    {
        std::lock_guard lock(mutex_);
        bool newly_connected = true;
        {
            Statement select(db_, "SELECT status FROM clients WHERE address = ?1");
            select.bind(1, address);
            if (select.step())
            {
                newly_connected = select.column_text(0) != protocol::to_string(ClientStatus::Connected);
            }
        }

        Statement upsert(db_, "INSERT INTO clients(address, user_agent, status, last_seen)"
                              " VALUES(?1, ?2, 'connected', ?3)"
                              " ON CONFLICT(address) DO UPDATE SET status = 'connected', last_seen = excluded.last_seen,"
                              " user_agent = CASE WHEN excluded.user_agent <> '' THEN excluded.user_agent"
                              " ELSE clients.user_agent END");
        upsert.bind(1, address);
        upsert.bind(2, user_agent);
        upsert.bind(3, clock_());
        upsert.run();

        Statement select(db_, std::string("SELECT ") + kClientColumns + " FROM clients WHERE address = ?1");
        select.bind(1, address);
        if (!select.step())
        {
            throw StoreError("Client row vanished after upsert: " + address);
        }
        return {.client = read_client(select), .newly_connected = newly_connected};
    }

    std::optional<protocol::ClientRecord> Store::find_client(const std::string &address)
    {
        std::lock_guard lock(mutex_);
        Statement select(db_, std::string("SELECT ") + kClientColumns + " FROM clients WHERE address = ?1");
        select.bind(1, address);
        if (select.step())
        {
            return read_client(select);
        }
        return std::nullopt;
    }

    bool Store::mark_client_disconnected(const std::string &address)
    {
        std::lock_guard lock(mutex_);
        Statement update(db_, "UPDATE clients SET status = 'disconnected' WHERE address = ?1 AND status = 'connected'");
        update.bind(1, address);
        update.run();
        return sqlite3_changes(db_) > 0;
    }

    std::vector<protocol::ClientRecord> Store::stale_clients(protocol::Timestamp seen_before)
    {
        std::lock_guard lock(mutex_);
        Statement select(db_, std::string("SELECT ") + kClientColumns +
                                  " FROM clients WHERE status = 'connected' AND last_seen < ?1 ORDER BY address");
        select.bind(1, seen_before);
        std::vector<ClientRecord> clients;
        while (select.step())
        {
            clients.push_back(read_client(select));
        }
        return clients;
    }

    std::vector<protocol::ClientRecord> Store::list_clients()
    {
        std::lock_guard lock(mutex_);
        Statement select(db_, std::string("SELECT ") + kClientColumns + " FROM clients ORDER BY last_seen DESC");
        std::vector<ClientRecord> clients;
        while (select.step())
        {
            clients.push_back(read_client(select));
        }
        return clients;
    }

    std::optional<std::string> Store::get_fact(const std::string &key)
    {
        std::lock_guard lock(mutex_);
        Statement select(db_, "SELECT value FROM kv WHERE key = ?1");
        select.bind(1, key);
        if (select.step())
        {
            return select.column_text(0);
        }
        return std::nullopt;
    }

    void Store::set_fact(const std::string &key, const std::string &value)
    {
        std::lock_guard lock(mutex_);
        Statement upsert(db_, "INSERT INTO kv(key, value, updated_at) VALUES(?1, ?2, ?3)"
                              " ON CONFLICT(key) DO UPDATE SET value = excluded.value, updated_at = excluded.updated_at");
        upsert.bind(1, key);
        upsert.bind(2, value);
        upsert.bind(3, clock_());
        upsert.run();
    }

    UploadCounts Store::counts()
    {
        std::lock_guard lock(mutex_);
        UploadCounts counts{};
        {
            Statement select(db_, "SELECT status, COUNT(*) FROM uploads GROUP BY status");
            while (select.step())
            {
                const auto status = protocol::upload_status_from_string(select.column_text(0));
                const auto count = static_cast<std::uint64_t>(select.column_int64(1));
                if (!status)
                {
                    continue;
                }
                switch (*status)
                {
                case UploadStatus::Init:
                    counts.init = count;
                    break;
                case UploadStatus::Uploading:
                    counts.uploading = count;
                    break;
                case UploadStatus::Complete:
                    counts.complete = count;
                    break;
                case UploadStatus::Disconnected:
                    counts.disconnected = count;
                    break;
                }
            }
        }
        Statement clients(db_, "SELECT COUNT(*), COALESCE(SUM(status = 'connected'), 0) FROM clients");
        if (clients.step())
        {
            counts.clients_total = static_cast<std::uint64_t>(clients.column_int64(0));
            counts.clients_connected = static_cast<std::uint64_t>(clients.column_int64(1));
        }
        return counts;
    }

} // namespace drcv::server
