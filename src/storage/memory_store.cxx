/*
 *     Copyright 2021 Couchbase, Inc.
 *
 *   Licensed under the Apache License, Version 2.0 (the "License");
 *   you may not use this file except in compliance with the License.
 *   You may obtain a copy of the License at
 *
 *       http://www.apache.org/licenses/LICENSE-2.0
 *
 *   Unless required by applicable law or agreed to in writing, software
 *   distributed under the License is distributed on an "AS IS" BASIS,
 *   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *   See the License for the specific language governing permissions and
 *   limitations under the License.
 */

#include <credence/storage/memory_store.hxx>
#include <credence/transactions/exceptions.hxx>
#include <credence/transactions/internal/logging.hxx>
#include <credence/transactions/uid_generator.hxx>

#include <stdexcept>

namespace credence
{
namespace storage
{
    using transactions::storage_log;

    class memory_scope : public storage_scope
    {
      public:
        memory_scope(memory_store& store, enum isolation_level level, bool read_only, std::optional<table_map> snapshot)
          : store_(store)
          , id_(transactions::uid_generator::next())
          , level_(level)
          , read_only_(read_only)
          , active_(true)
          , snapshot_(std::move(snapshot))
        {
        }

        ~memory_scope() override
        {
            if (active_) {
                storage_log->debug("scope {} destroyed while still active, rolling back", id_);
                try {
                    store_.rollback(*this);
                } catch (const std::exception& e) {
                    storage_log->error("rollback of abandoned scope {} failed: {}", id_, e.what());
                }
            }
        }

        CR_NODISCARD const std::string& id() const override
        {
            return id_;
        }

        CR_NODISCARD enum isolation_level isolation_level() const override
        {
            return level_;
        }

        CR_NODISCARD bool read_only() const override
        {
            return read_only_;
        }

        CR_NODISCARD bool active() const override
        {
            return active_;
        }

        CR_NODISCARD std::string key_field(const std::string& table) const override
        {
            return store_.key_field(table);
        }

        nlohmann::json create(const std::string& table, nlohmann::json record) override
        {
            std::unique_lock<std::mutex> lock(store_.mutex_);
            check_writable("create");
            if (!record.is_object()) {
                throw transactions::validation_error("record for table " + table + " must be an object");
            }
            auto field = store_.key_field_locked(table);
            if (!record.contains(field) || record[field].is_null()) {
                record[field] = transactions::uid_generator::next();
            }
            auto key = record_key(record[field]);
            store_.lock_row(lock, *this, table, key);
            if (read_locked(table, key)) {
                throw transactions::business_rule_error("duplicate key " + key + " in table " + table);
            }
            staged_[table][key] = record;
            return record;
        }

        std::optional<nlohmann::json> find(const std::string& table, const std::string& key) override
        {
            std::unique_lock<std::mutex> lock(store_.mutex_);
            check_active("find");
            return read_locked(table, key);
        }

        std::vector<nlohmann::json> find_all(const std::string& table) override
        {
            std::unique_lock<std::mutex> lock(store_.mutex_);
            check_active("find_all");
            table_rows rows;
            const table_map& base = snapshot_ ? *snapshot_ : store_.tables_;
            auto base_it = base.find(table);
            if (base_it != base.end()) {
                rows = base_it->second;
            }
            if (level_ == isolation_level::READ_UNCOMMITTED) {
                for (auto& entry : store_.locks_) {
                    if (entry.first.first != table || entry.second == this) {
                        continue;
                    }
                    overlay(rows, entry.second->staged_, table, entry.first.second);
                }
            }
            auto own = staged_.find(table);
            if (own != staged_.end()) {
                for (auto& row : own->second) {
                    overlay(rows, staged_, table, row.first);
                }
            }
            std::vector<nlohmann::json> retval;
            retval.reserve(rows.size());
            for (auto& row : rows) {
                retval.push_back(row.second);
            }
            return retval;
        }

        nlohmann::json upsert(const std::string& table, nlohmann::json record) override
        {
            std::unique_lock<std::mutex> lock(store_.mutex_);
            check_writable("upsert");
            auto field = store_.key_field_locked(table);
            if (!record.is_object() || !record.contains(field) || record[field].is_null()) {
                throw transactions::validation_error("upsert into " + table + " needs a value for " + field);
            }
            auto key = record_key(record[field]);
            store_.lock_row(lock, *this, table, key);
            staged_[table][key] = record;
            return record;
        }

        std::optional<nlohmann::json> update(const std::string& table, const std::string& key, const nlohmann::json& patch) override
        {
            std::unique_lock<std::mutex> lock(store_.mutex_);
            check_writable("update");
            store_.lock_row(lock, *this, table, key);
            auto current = read_locked(table, key);
            if (!current) {
                return {};
            }
            auto field = store_.key_field_locked(table);
            auto original_key = (*current)[field];
            current->update(patch);
            (*current)[field] = original_key;
            staged_[table][key] = *current;
            return current;
        }

        bool remove(const std::string& table, const std::string& key) override
        {
            std::unique_lock<std::mutex> lock(store_.mutex_);
            check_writable("remove");
            store_.lock_row(lock, *this, table, key);
            if (!read_locked(table, key)) {
                return false;
            }
            staged_[table][key] = std::nullopt;
            return true;
        }

      private:
        friend class memory_store;

        typedef std::map<std::string, std::map<std::string, std::optional<nlohmann::json>>> staged_map;

        memory_store& store_;
        std::string id_;
        enum isolation_level level_;
        bool read_only_;
        bool active_;
        std::optional<table_map> snapshot_;
        staged_map staged_;

        void check_active(const char* op) const
        {
            if (!active_) {
                throw std::logic_error(std::string(op) + " on scope " + id_ + " which is no longer active");
            }
        }

        void check_writable(const char* op) const
        {
            check_active(op);
            if (read_only_) {
                throw transactions::validation_error(std::string(op) + " not allowed in read-only scope " + id_);
            }
        }

        static void overlay(table_rows& rows, const staged_map& staged, const std::string& table, const std::string& key)
        {
            auto t = staged.find(table);
            if (t == staged.end()) {
                return;
            }
            auto row = t->second.find(key);
            if (row == t->second.end()) {
                return;
            }
            if (row->second) {
                rows[key] = *row->second;
            } else {
                rows.erase(key);
            }
        }

        // caller holds the store mutex
        std::optional<nlohmann::json> read_locked(const std::string& table, const std::string& key) const
        {
            auto own = staged_lookup(staged_, table, key);
            if (own) {
                return *own;
            }
            if (level_ == isolation_level::READ_UNCOMMITTED) {
                auto owner = store_.locks_.find({ table, key });
                if (owner != store_.locks_.end() && owner->second != this) {
                    auto dirty = staged_lookup(owner->second->staged_, table, key);
                    if (dirty) {
                        return *dirty;
                    }
                }
            }
            const table_map& base = snapshot_ ? *snapshot_ : store_.tables_;
            auto t = base.find(table);
            if (t == base.end()) {
                return {};
            }
            auto row = t->second.find(key);
            if (row == t->second.end()) {
                return {};
            }
            return row->second;
        }

        // outer optional: whether the row is staged at all, inner: staged value or a staged delete
        static std::optional<std::optional<nlohmann::json>> staged_lookup(const staged_map& staged,
                                                                          const std::string& table,
                                                                          const std::string& key)
        {
            auto t = staged.find(table);
            if (t == staged.end()) {
                return {};
            }
            auto row = t->second.find(key);
            if (row == t->second.end()) {
                return {};
            }
            return row->second;
        }
    };

    memory_store::memory_store(std::chrono::milliseconds lock_timeout)
      : lock_timeout_(lock_timeout)
    {
    }

    memory_store::~memory_store()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!scopes_.empty()) {
            storage_log->warn("memory store destroyed with {} scopes still open", scopes_.size());
        }
    }

    void memory_store::define_table(const std::string& table, const std::string& key_field)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        key_fields_[table] = key_field;
    }

    std::string memory_store::key_field(const std::string& table) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return key_field_locked(table);
    }

    std::string memory_store::key_field_locked(const std::string& table) const
    {
        auto it = key_fields_.find(table);
        if (it == key_fields_.end()) {
            return "id";
        }
        return it->second;
    }

    std::unique_ptr<storage_scope> memory_store::begin_transaction(isolation_level level, bool read_only)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::optional<table_map> snapshot;
        if (level == isolation_level::REPEATABLE_READ || level == isolation_level::SERIALIZABLE) {
            snapshot = tables_;
        }
        auto scope = std::make_unique<memory_scope>(*this, level, read_only, std::move(snapshot));
        scopes_[scope->id()] = scope.get();
        storage_log->trace("began scope {} ({}{})",
                           scope->id(),
                           transactions::isolation_level_to_string(level),
                           read_only ? ", read-only" : "");
        return scope;
    }

    void memory_store::commit(storage_scope& scope)
    {
        finish(as_memory_scope(scope), true);
    }

    void memory_store::rollback(storage_scope& scope)
    {
        finish(as_memory_scope(scope), false);
    }

    memory_scope& memory_store::as_memory_scope(storage_scope& scope)
    {
        auto mem = dynamic_cast<memory_scope*>(&scope);
        if (nullptr == mem || &mem->store_ != this) {
            throw std::invalid_argument("scope " + scope.id() + " does not belong to this store");
        }
        return *mem;
    }

    void memory_store::lock_row(std::unique_lock<std::mutex>& lock, memory_scope& scope, const std::string& table, const std::string& key)
    {
        row_id id{ table, key };
        bool acquired = lock_released_.wait_for(lock, lock_timeout_, [&]() {
            auto it = locks_.find(id);
            return it == locks_.end() || it->second == &scope;
        });
        if (!acquired) {
            storage_log->debug("scope {} timed out waiting for lock on {}/{}", scope.id(), table, key);
            throw transactions::transient_storage_error("lock wait timeout on " + table + "/" + key);
        }
        locks_[id] = &scope;
    }

    void memory_store::release_locks_locked(memory_scope& scope)
    {
        for (auto it = locks_.begin(); it != locks_.end();) {
            if (it->second == &scope) {
                it = locks_.erase(it);
            } else {
                ++it;
            }
        }
    }

    void memory_store::finish(memory_scope& scope, bool apply)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            scope.check_active(apply ? "commit" : "rollback");
            if (apply) {
                for (auto& table : scope.staged_) {
                    auto& rows = tables_[table.first];
                    for (auto& row : table.second) {
                        if (row.second) {
                            rows[row.first] = *row.second;
                        } else {
                            rows.erase(row.first);
                        }
                    }
                }
            }
            scope.staged_.clear();
            release_locks_locked(scope);
            scope.active_ = false;
            scopes_.erase(scope.id());
        }
        lock_released_.notify_all();
        storage_log->trace("{} scope {}", apply ? "committed" : "rolled back", scope.id());
    }

    std::optional<nlohmann::json> memory_store::get(const std::string& table, const std::string& key) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto t = tables_.find(table);
        if (t == tables_.end()) {
            return {};
        }
        auto row = t->second.find(key);
        if (row == t->second.end()) {
            return {};
        }
        return row->second;
    }

    std::vector<nlohmann::json> memory_store::all(const std::string& table) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<nlohmann::json> retval;
        auto t = tables_.find(table);
        if (t != tables_.end()) {
            for (auto& row : t->second) {
                retval.push_back(row.second);
            }
        }
        return retval;
    }

    size_t memory_store::size(const std::string& table) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto t = tables_.find(table);
        return t == tables_.end() ? 0 : t->second.size();
    }

    void memory_store::clear()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tables_.clear();
    }

    size_t memory_store::active_scopes() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return scopes_.size();
    }
} // namespace storage
} // namespace credence
