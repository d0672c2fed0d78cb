#include "cronwork/storage/task_registry.hpp"

#include "cronwork/storage/state_strings.hpp"
#include "cronwork/util/log.hpp"

#include <nlohmann/json.hpp>
#include <sqlite3.h>

#include <algorithm>
#include <format>
#include <map>
#include <ranges>
#include <unordered_set>
#include <utility>

namespace cronwork {

namespace {

constexpr auto kTaskColumns = R"(
  id, uuid, task_name, group_name, function_ref, args, kwargs, cron,
  start_time, period, stop_time, repeats, times_run, prevent_drift, timeout,
  retry_failed, times_failed, immediate, sync_output, next_run_time, status,
  assigned_worker, last_run_time, enabled
)";

// Every predecessor of the row completed a run after the row's own last
// completed run started. Must agree with DependencySnapshot::ready().
constexpr auto kReadyClause = R"(
  NOT EXISTS (
    SELECT 1 FROM task_deps d
    WHERE d.successor_id = tasks.id
      AND NOT EXISTS (
        SELECT 1 FROM task_runs r
        WHERE r.task_id = d.predecessor_id AND r.status = 'completed'
          AND r.stop_time > COALESCE(
            (SELECT MAX(s.start_time) FROM task_runs s
             WHERE s.task_id = tasks.id AND s.status = 'completed'), 0)))
)";

constexpr auto kWorkerLost = "worker lost";

auto col_text(sqlite3_stmt* stmt, int col) -> std::string {
  auto* p = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
  return p ? p : "";
}

auto col_time(sqlite3_stmt* stmt, int col) -> TimePoint {
  return from_millis(sqlite3_column_int64(stmt, col));
}

auto col_json(sqlite3_stmt* stmt, int col, nlohmann::json fallback)
    -> nlohmann::json {
  auto parsed = nlohmann::json::parse(col_text(stmt, col), nullptr, false);
  return parsed.is_discarded() ? fallback : parsed;
}

auto bind_text(sqlite3_stmt* stmt, int idx, std::string_view text) -> void {
  sqlite3_bind_text(stmt, idx, text.data(), static_cast<int>(text.size()),
                    SQLITE_TRANSIENT);
}

auto bind_time(sqlite3_stmt* stmt, int idx, TimePoint tp) -> void {
  sqlite3_bind_int64(stmt, idx, to_millis(tp));
}

auto read_task(sqlite3_stmt* stmt) -> Task {
  Task task;
  task.id = sqlite3_column_int64(stmt, 0);
  task.uuid = col_text(stmt, 1);
  task.task_name = col_text(stmt, 2);
  task.group_name = col_text(stmt, 3);
  task.function_ref = col_text(stmt, 4);
  task.args = col_json(stmt, 5, nlohmann::json::array());
  task.kwargs = col_json(stmt, 6, nlohmann::json::object());
  task.cron = col_text(stmt, 7);
  task.start_time = col_time(stmt, 8);
  task.period = std::chrono::seconds(sqlite3_column_int64(stmt, 9));
  if (sqlite3_column_type(stmt, 10) != SQLITE_NULL) {
    task.stop_time = col_time(stmt, 10);
  }
  task.repeats = sqlite3_column_int(stmt, 11);
  task.times_run = sqlite3_column_int(stmt, 12);
  task.prevent_drift = sqlite3_column_int(stmt, 13) != 0;
  task.timeout = std::chrono::seconds(sqlite3_column_int64(stmt, 14));
  task.retry_failed = sqlite3_column_int(stmt, 15);
  task.times_failed = sqlite3_column_int(stmt, 16);
  task.immediate = sqlite3_column_int(stmt, 17) != 0;
  task.sync_output_interval =
      std::chrono::seconds(sqlite3_column_int64(stmt, 18));
  task.next_run_time = col_time(stmt, 19);
  task.status =
      parse_task_status(col_text(stmt, 20)).value_or(TaskStatus::Queued);
  task.assigned_worker = col_text(stmt, 21);
  task.last_run_time = col_time(stmt, 22);
  task.enabled = sqlite3_column_int(stmt, 23) != 0;
  return task;
}

auto read_worker(sqlite3_stmt* stmt) -> WorkerInfo {
  WorkerInfo worker;
  worker.worker_name = col_text(stmt, 0);
  auto groups = col_json(stmt, 1, nlohmann::json::array());
  for (const auto& g : groups) {
    if (g.is_string()) {
      worker.group_names.push_back(g.get<std::string>());
    }
  }
  worker.first_heartbeat = col_time(stmt, 2);
  worker.last_heartbeat = col_time(stmt, 3);
  worker.status =
      parse_worker_status(col_text(stmt, 4)).value_or(WorkerStatus::Active);
  return worker;
}

auto effective_job(std::string_view job_name) -> std::string_view {
  return job_name.empty() ? kDefaultJob : job_name;
}

}  // namespace

auto TaskRegistry::DbDeleter::operator()(sqlite3* db) const -> void {
  if (db)
    sqlite3_close(db);
}

TaskRegistry::Statement::~Statement() {
  reset();
}

auto TaskRegistry::Statement::reset() -> void {
  if (stmt_) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
  }
}

auto TaskRegistry::prepare(const char* sql) -> Result<sqlite3_stmt*> {
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_.get(), sql, -1, &stmt, nullptr) != SQLITE_OK) {
    log::error("Failed to prepare statement: {}", sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return stmt;
}

auto TaskRegistry::changes() const -> int {
  return sqlite3_changes(db_.get());
}

TaskRegistry::TaskRegistry(std::string_view db_path,
                           std::chrono::milliseconds busy_timeout)
    : db_path_(db_path), busy_timeout_(busy_timeout) {
}

TaskRegistry::~TaskRegistry() {
  close();
}

auto TaskRegistry::open() -> Result<void> {
  if (db_) {
    return ok();
  }

  sqlite3* raw_db = nullptr;
  int rc = sqlite3_open(db_path_.c_str(), &raw_db);
  if (rc != SQLITE_OK) {
    log::error("Failed to open database {}: {}", db_path_,
               raw_db ? sqlite3_errmsg(raw_db) : "out of memory");
    if (raw_db) {
      sqlite3_close(raw_db);
    }
    return fail(Error::DatabaseOpenFailed);
  }
  db_.reset(raw_db);

  sqlite3_busy_timeout(db_.get(), static_cast<int>(busy_timeout_.count()));

  if (auto r = execute("PRAGMA journal_mode=WAL;"); !r) {
    log::warn("Failed to set WAL mode: {}", r.error().message());
  }
  if (auto r = execute("PRAGMA synchronous=NORMAL;"); !r) {
    log::warn("Failed to set synchronous mode: {}", r.error().message());
  }
  if (auto r = execute("PRAGMA foreign_keys=ON;"); !r) {
    log::warn("Failed to enable foreign keys: {}", r.error().message());
  }

  if (auto r = create_tables(); !r) {
    close();
    return r;
  }

  log::debug("Registry opened: {}", db_path_);
  return ok();
}

auto TaskRegistry::close() -> void {
  db_.reset();
}

auto TaskRegistry::create_tables() -> Result<void> {
  const char* sql = R"(
    CREATE TABLE IF NOT EXISTS tasks (
      id INTEGER PRIMARY KEY AUTOINCREMENT,
      uuid TEXT NOT NULL UNIQUE,
      task_name TEXT NOT NULL DEFAULT '',
      group_name TEXT NOT NULL DEFAULT 'main',
      function_ref TEXT NOT NULL,
      args TEXT NOT NULL DEFAULT '[]',
      kwargs TEXT NOT NULL DEFAULT '{}',
      cron TEXT NOT NULL DEFAULT '',
      start_time INTEGER NOT NULL,
      period INTEGER NOT NULL DEFAULT 0,
      stop_time INTEGER,
      repeats INTEGER NOT NULL DEFAULT 1 CHECK (repeats >= 0),
      times_run INTEGER NOT NULL DEFAULT 0,
      prevent_drift INTEGER NOT NULL DEFAULT 0,
      timeout INTEGER NOT NULL DEFAULT 60,
      retry_failed INTEGER NOT NULL DEFAULT 0 CHECK (retry_failed >= 0),
      times_failed INTEGER NOT NULL DEFAULT 0 CHECK (times_failed >= 0),
      immediate INTEGER NOT NULL DEFAULT 0,
      sync_output INTEGER NOT NULL DEFAULT 0,
      next_run_time INTEGER NOT NULL,
      status TEXT NOT NULL DEFAULT 'queued',
      assigned_worker TEXT,
      last_run_time INTEGER NOT NULL DEFAULT 0,
      enabled INTEGER NOT NULL DEFAULT 1
    );

    CREATE INDEX IF NOT EXISTS idx_tasks_status_next
      ON tasks(status, next_run_time);

    CREATE TABLE IF NOT EXISTS task_runs (
      id INTEGER PRIMARY KEY AUTOINCREMENT,
      task_id INTEGER NOT NULL,
      status TEXT NOT NULL DEFAULT 'running',
      start_time INTEGER NOT NULL,
      stop_time INTEGER NOT NULL DEFAULT 0,
      output TEXT NOT NULL DEFAULT '',
      result TEXT NOT NULL DEFAULT '',
      traceback TEXT NOT NULL DEFAULT '',
      worker_name TEXT NOT NULL,
      FOREIGN KEY (task_id) REFERENCES tasks(id) ON DELETE CASCADE
    );

    CREATE INDEX IF NOT EXISTS idx_task_runs_task_status
      ON task_runs(task_id, status);

    CREATE TABLE IF NOT EXISTS workers (
      worker_name TEXT PRIMARY KEY,
      group_names TEXT NOT NULL DEFAULT '[]',
      first_heartbeat INTEGER NOT NULL,
      last_heartbeat INTEGER NOT NULL,
      status TEXT NOT NULL DEFAULT 'active'
    );

    CREATE TABLE IF NOT EXISTS task_deps (
      job_name TEXT NOT NULL,
      predecessor_id INTEGER NOT NULL,
      successor_id INTEGER NOT NULL,
      PRIMARY KEY (job_name, predecessor_id, successor_id),
      FOREIGN KEY (predecessor_id) REFERENCES tasks(id) ON DELETE CASCADE,
      FOREIGN KEY (successor_id) REFERENCES tasks(id) ON DELETE CASCADE
    );

    CREATE INDEX IF NOT EXISTS idx_task_deps_successor
      ON task_deps(successor_id);
  )";

  return execute(sql);
}

auto TaskRegistry::execute(std::string_view sql) -> Result<void> {
  char* err_msg = nullptr;
  std::string sql_str{sql};
  int rc = sqlite3_exec(db_.get(), sql_str.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    log::error("SQL error: {}", err_msg ? err_msg : sqlite3_errstr(rc));
    sqlite3_free(err_msg);
    return fail(Error::DatabaseQueryFailed);
  }
  return ok();
}

auto TaskRegistry::begin_transaction() -> Result<void> {
  return execute("BEGIN IMMEDIATE;");
}

auto TaskRegistry::commit_transaction() -> Result<void> {
  return execute("COMMIT;");
}

auto TaskRegistry::rollback_transaction() -> Result<void> {
  return execute("ROLLBACK;");
}

auto TaskRegistry::write_task(const Task& task, bool replace)
    -> Result<TaskId> {
  constexpr auto insert_sql = R"(
    INSERT INTO tasks
      (uuid, task_name, group_name, function_ref, args, kwargs, cron,
       start_time, period, stop_time, repeats, times_run, prevent_drift,
       timeout, retry_failed, times_failed, immediate, sync_output,
       next_run_time, status, assigned_worker, last_run_time, enabled)
    VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13, ?14, ?15,
            ?16, ?17, ?18, ?19, ?20, NULL, 0, ?21);
  )";
  constexpr auto replace_sql = R"(
    UPDATE tasks SET
      task_name = ?2, group_name = ?3, function_ref = ?4, args = ?5,
      kwargs = ?6, cron = ?7, start_time = ?8, period = ?9, stop_time = ?10,
      repeats = ?11, times_run = ?12, prevent_drift = ?13, timeout = ?14,
      retry_failed = ?15, times_failed = ?16, immediate = ?17,
      sync_output = ?18, next_run_time = ?19, status = ?20,
      assigned_worker = NULL, enabled = ?21
    WHERE uuid = ?1 AND status NOT IN ('assigned', 'running');
  )";

  auto result = prepare(replace ? replace_sql : insert_sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  auto* s = stmt.get();
  bind_text(s, 1, task.uuid);
  bind_text(s, 2, task.task_name);
  bind_text(s, 3, task.group_name);
  bind_text(s, 4, task.function_ref);
  bind_text(s, 5, task.args.dump());
  bind_text(s, 6, task.kwargs.dump());
  bind_text(s, 7, task.cron);
  bind_time(s, 8, task.start_time);
  sqlite3_bind_int64(s, 9, task.period.count());
  if (task.stop_time) {
    bind_time(s, 10, *task.stop_time);
  } else {
    sqlite3_bind_null(s, 10);
  }
  sqlite3_bind_int(s, 11, task.repeats);
  sqlite3_bind_int(s, 12, task.times_run);
  sqlite3_bind_int(s, 13, task.prevent_drift ? 1 : 0);
  sqlite3_bind_int64(s, 14, task.timeout.count());
  sqlite3_bind_int(s, 15, task.retry_failed);
  sqlite3_bind_int(s, 16, task.times_failed);
  sqlite3_bind_int(s, 17, task.immediate ? 1 : 0);
  sqlite3_bind_int64(s, 18, task.sync_output_interval.count());
  bind_time(s, 19, task.next_run_time);
  bind_text(s, 20, task_status_name(task.status));
  sqlite3_bind_int(s, 21, task.enabled ? 1 : 0);

  int rc = sqlite3_step(s);
  if (rc == SQLITE_CONSTRAINT) {
    return fail(Error::AlreadyExists);
  }
  if (rc != SQLITE_DONE) {
    log::error("Failed to write task {}: {}", task.uuid,
               sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }

  if (!replace) {
    return sqlite3_last_insert_rowid(db_.get());
  }
  bool replaced = changes() > 0;

  auto found = find_tasks(TaskUuid{task.uuid});
  if (!found)
    return std::unexpected(found.error());
  if (found->empty())
    return fail(Error::NotFound);
  if (!replaced) {
    log::debug("Task {} is {}, not replacing it", task.uuid,
               task_status_name(found->front().status));
    return fail(Error::TaskRunning);
  }
  return found->front().id;
}

auto TaskRegistry::insert_task(const Task& task, std::string_view job_name,
                               std::span<const TaskId> depends_on)
    -> Result<TaskId> {
  if (auto r = begin_transaction(); !r)
    return std::unexpected(r.error());

  auto id = write_task(task, false);
  if (!id) {
    (void)rollback_transaction();
    return id;
  }

  auto edges = depends_on | std::views::transform([&](TaskId pred) {
                 return DependencyEdge{.predecessor = pred, .successor = *id};
               }) |
               std::ranges::to<std::vector>();
  if (auto r = add_dependencies_locked(job_name, edges); !r) {
    (void)rollback_transaction();
    return std::unexpected(r.error());
  }

  if (auto r = commit_transaction(); !r)
    return std::unexpected(r.error());
  return id;
}

auto TaskRegistry::replace_task(const Task& task, std::string_view job_name,
                                std::span<const TaskId> depends_on)
    -> Result<TaskId> {
  if (auto r = begin_transaction(); !r)
    return std::unexpected(r.error());

  auto id = write_task(task, true);
  if (!id) {
    (void)rollback_transaction();
    return id;
  }

  auto edges = depends_on | std::views::transform([&](TaskId pred) {
                 return DependencyEdge{.predecessor = pred, .successor = *id};
               }) |
               std::ranges::to<std::vector>();
  if (auto r = add_dependencies_locked(job_name, edges); !r) {
    (void)rollback_transaction();
    return std::unexpected(r.error());
  }

  if (auto r = commit_transaction(); !r)
    return std::unexpected(r.error());
  return id;
}

auto TaskRegistry::find_tasks(const TaskQuery& query, bool include_output)
    -> Result<std::vector<Task>> {
  std::string sql = std::format("SELECT {} FROM tasks", kTaskColumns);
  std::vector<std::string> text_params;
  TaskId id_param = kInvalidTaskId;
  const TaskFilter* filter = std::get_if<TaskFilter>(&query);

  if (const auto* id = std::get_if<TaskId>(&query)) {
    sql += " WHERE id = ?";
    id_param = *id;
  } else if (const auto* uuid = std::get_if<TaskUuid>(&query)) {
    sql += " WHERE uuid = ?";
    text_params.push_back(uuid->value);
  } else if (filter) {
    std::vector<std::string> conds;
    if (filter->status) {
      conds.emplace_back("status = ?");
      text_params.emplace_back(task_status_name(*filter->status));
    }
    if (!filter->group_name.empty()) {
      conds.emplace_back("group_name = ?");
      text_params.push_back(filter->group_name);
    }
    if (!filter->task_name.empty()) {
      conds.emplace_back("task_name = ?");
      text_params.push_back(filter->task_name);
    }
    if (!filter->function_ref.empty()) {
      conds.emplace_back("function_ref = ?");
      text_params.push_back(filter->function_ref);
    }
    for (auto [i, cond] : std::views::enumerate(conds)) {
      sql += i == 0 ? " WHERE " : " AND ";
      sql += cond;
    }
  }
  sql += " ORDER BY id;";

  auto result = prepare(sql.c_str());
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  if (id_param != kInvalidTaskId) {
    sqlite3_bind_int64(stmt.get(), 1, id_param);
  }
  for (auto [i, param] : std::views::enumerate(text_params)) {
    bind_text(stmt.get(), static_cast<int>(i) + 1, param);
  }

  std::vector<Task> tasks;
  int rc = SQLITE_OK;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    Task task = read_task(stmt.get());
    if (filter && filter->predicate && !filter->predicate(task)) {
      continue;
    }
    tasks.push_back(std::move(task));
  }
  if (rc != SQLITE_DONE) {
    log::error("Failed to query tasks: {}", sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }

  if (include_output) {
    for (auto& task : tasks) {
      if (auto r = load_latest_run(task); !r)
        return std::unexpected(r.error());
    }
  }
  return tasks;
}

auto TaskRegistry::get_task(TaskId id) -> Result<Task> {
  auto tasks = find_tasks(id);
  if (!tasks)
    return std::unexpected(tasks.error());
  if (tasks->empty())
    return fail(Error::NotFound);
  return std::move(tasks->front());
}

auto TaskRegistry::load_latest_run(Task& task) -> Result<void> {
  constexpr auto sql = R"(
    SELECT output, result FROM task_runs
    WHERE task_id = ? ORDER BY id DESC LIMIT 1;
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  sqlite3_bind_int64(stmt.get(), 1, task.id);
  if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    task.output = col_text(stmt.get(), 0);
    auto text = col_text(stmt.get(), 1);
    if (!text.empty()) {
      task.result = nlohmann::json::parse(text, nullptr, false);
      if (task.result.is_discarded()) {
        task.result = text;
      }
    }
  }
  return ok();
}

auto TaskRegistry::task_status_of(TaskId id) -> Result<TaskStatus> {
  constexpr auto sql = "SELECT status FROM tasks WHERE id = ?;";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  sqlite3_bind_int64(stmt.get(), 1, id);
  if (sqlite3_step(stmt.get()) != SQLITE_ROW)
    return fail(Error::NotFound);
  return parse_task_status(col_text(stmt.get(), 0)).value_or(TaskStatus::Queued);
}

auto TaskRegistry::set_task_enabled(TaskId id, bool enabled) -> Result<void> {
  constexpr auto sql = "UPDATE tasks SET enabled = ? WHERE id = ?;";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  sqlite3_bind_int(stmt.get(), 1, enabled ? 1 : 0);
  sqlite3_bind_int64(stmt.get(), 2, id);
  if (sqlite3_step(stmt.get()) != SQLITE_DONE)
    return fail(Error::DatabaseQueryFailed);
  if (changes() == 0)
    return fail(Error::NotFound);
  return ok();
}

auto TaskRegistry::stop_task(TaskId id) -> Result<TaskStatus> {
  constexpr auto sql = R"(
    UPDATE tasks SET status = 'stopped'
    WHERE id = ? AND status IN ('queued', 'assigned', 'running');
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  sqlite3_bind_int64(stmt.get(), 1, id);
  if (sqlite3_step(stmt.get()) != SQLITE_DONE)
    return fail(Error::DatabaseQueryFailed);
  return task_status_of(id);
}

auto TaskRegistry::stop_task(const TaskUuid& uuid) -> Result<TaskStatus> {
  auto tasks = find_tasks(uuid);
  if (!tasks)
    return std::unexpected(tasks.error());
  if (tasks->empty())
    return fail(Error::NotFound);
  return stop_task(tasks->front().id);
}

auto TaskRegistry::due_tasks(TimePoint now, std::span<const std::string> groups,
                             std::size_t limit) -> Result<std::vector<Task>> {
  if (groups.empty()) {
    return std::vector<Task>{};
  }

  std::string placeholders;
  for (std::size_t i = 0; i < groups.size(); ++i) {
    placeholders += i == 0 ? "?" : ", ?";
  }
  auto sql = std::format(R"(
    SELECT {} FROM tasks
    WHERE status = 'queued' AND enabled = 1 AND next_run_time <= ?
      AND group_name IN ({}) AND {}
    ORDER BY next_run_time, id LIMIT ?;
  )",
                         kTaskColumns, placeholders, kReadyClause);

  auto result = prepare(sql.c_str());
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  int idx = 1;
  bind_time(stmt.get(), idx++, now);
  for (const auto& group : groups) {
    bind_text(stmt.get(), idx++, group);
  }
  sqlite3_bind_int64(stmt.get(), idx, static_cast<sqlite3_int64>(limit));

  std::vector<Task> tasks;
  int rc = SQLITE_OK;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    tasks.push_back(read_task(stmt.get()));
  }
  if (rc != SQLITE_DONE) {
    log::error("Failed to poll due tasks: {}", sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return tasks;
}

auto TaskRegistry::claim(TaskId id, std::string_view worker_name)
    -> Result<void> {
  auto sql = std::format(R"(
    UPDATE tasks SET status = 'assigned', assigned_worker = ?
    WHERE id = ? AND status = 'queued' AND enabled = 1 AND {};
  )",
                         kReadyClause);

  auto result = prepare(sql.c_str());
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, worker_name);
  sqlite3_bind_int64(stmt.get(), 2, id);
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    log::warn("Claim of task {} failed: {}", id, sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  if (changes() != 1) {
    return fail(Error::ClaimLost);
  }
  return ok();
}

auto TaskRegistry::release_claim(TaskId id, std::string_view worker_name)
    -> Result<void> {
  constexpr auto sql = R"(
    UPDATE tasks SET status = 'queued', assigned_worker = NULL
    WHERE id = ? AND assigned_worker = ? AND status = 'assigned';
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  sqlite3_bind_int64(stmt.get(), 1, id);
  bind_text(stmt.get(), 2, worker_name);
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    log::warn("Release of task {} failed: {}", id, sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  if (changes() != 1) {
    return fail(Error::ClaimLost);
  }
  return ok();
}

auto TaskRegistry::start_run(TaskId id, std::string_view worker_name,
                             TimePoint start) -> Result<RunId> {
  if (auto r = begin_transaction(); !r)
    return std::unexpected(r.error());

  {
    constexpr auto sql = R"(
      UPDATE tasks SET status = 'running', last_run_time = ?
      WHERE id = ? AND status = 'assigned' AND assigned_worker = ?;
    )";
    auto result = prepare(sql);
    if (!result) {
      (void)rollback_transaction();
      return std::unexpected(result.error());
    }
    Statement stmt(*result);

    bind_time(stmt.get(), 1, start);
    sqlite3_bind_int64(stmt.get(), 2, id);
    bind_text(stmt.get(), 3, worker_name);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
      (void)rollback_transaction();
      return fail(Error::DatabaseQueryFailed);
    }
    if (changes() != 1) {
      (void)rollback_transaction();
      return fail(Error::ClaimLost);
    }
  }

  constexpr auto sql = R"(
    INSERT INTO task_runs (task_id, status, start_time, worker_name)
    VALUES (?, 'running', ?, ?);
  )";
  auto result = prepare(sql);
  if (!result) {
    (void)rollback_transaction();
    return std::unexpected(result.error());
  }
  Statement stmt(*result);

  sqlite3_bind_int64(stmt.get(), 1, id);
  bind_time(stmt.get(), 2, start);
  bind_text(stmt.get(), 3, worker_name);
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    (void)rollback_transaction();
    return fail(Error::DatabaseQueryFailed);
  }
  RunId run_id = sqlite3_last_insert_rowid(db_.get());

  if (auto r = commit_transaction(); !r)
    return std::unexpected(r.error());
  return run_id;
}

auto TaskRegistry::sync_run_output(RunId run_id, std::string_view output)
    -> Result<void> {
  constexpr auto sql = R"(
    UPDATE task_runs SET output = ? WHERE id = ? AND status = 'running';
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, output);
  sqlite3_bind_int64(stmt.get(), 2, run_id);
  return sqlite3_step(stmt.get()) == SQLITE_DONE
             ? ok()
             : fail(Error::DatabaseQueryFailed);
}

auto TaskRegistry::close_run(const RunCompletion& completion, RunStatus status)
    -> Result<void> {
  constexpr auto sql = R"(
    UPDATE task_runs SET
      status = ?, stop_time = ?, output = ?, result = ?, traceback = ?
    WHERE id = ? AND status = 'running';
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, run_status_name(status));
  bind_time(stmt.get(), 2, completion.finished);
  bind_text(stmt.get(), 3, completion.output);
  bind_text(stmt.get(), 4, completion.result);
  bind_text(stmt.get(), 5, completion.traceback);
  sqlite3_bind_int64(stmt.get(), 6, completion.run_id);
  return sqlite3_step(stmt.get()) == SQLITE_DONE
             ? ok()
             : fail(Error::DatabaseQueryFailed);
}

auto TaskRegistry::complete_run(const RunCompletion& completion)
    -> Result<TaskStatus> {
  if (auto r = begin_transaction(); !r)
    return std::unexpected(r.error());

  TaskStatus current = TaskStatus::Queued;
  std::string owner;
  {
    constexpr auto sql =
        "SELECT status, assigned_worker FROM tasks WHERE id = ?;";
    auto result = prepare(sql);
    if (!result) {
      (void)rollback_transaction();
      return std::unexpected(result.error());
    }
    Statement stmt(*result);

    sqlite3_bind_int64(stmt.get(), 1, completion.task_id);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
      (void)rollback_transaction();
      return fail(Error::NotFound);
    }
    current =
        parse_task_status(col_text(stmt.get(), 0)).value_or(TaskStatus::Queued);
    owner = col_text(stmt.get(), 1);
  }

  if (current == TaskStatus::Stopped) {
    if (auto r = close_run(completion, RunStatus::Stopped); !r) {
      (void)rollback_transaction();
      return std::unexpected(r.error());
    }
    if (auto r = commit_transaction(); !r)
      return std::unexpected(r.error());
    return TaskStatus::Stopped;
  }

  if (current != TaskStatus::Running || owner != completion.worker_name) {
    // Reclaimed or redefined while we ran: keep the audit row, leave the task.
    if (auto r = close_run(completion, completion.run_status); !r) {
      (void)rollback_transaction();
      return std::unexpected(r.error());
    }
    if (auto r = commit_transaction(); !r)
      return std::unexpected(r.error());
    return fail(Error::ClaimLost);
  }

  if (auto r = close_run(completion, completion.run_status); !r) {
    (void)rollback_transaction();
    return std::unexpected(r.error());
  }

  constexpr auto sql = R"(
    UPDATE tasks SET
      status = ?, next_run_time = ?, repeats = ?, retry_failed = ?,
      times_failed = ?, times_run = ?
    WHERE id = ? AND status = 'running' AND assigned_worker = ?;
  )";
  auto result = prepare(sql);
  if (!result) {
    (void)rollback_transaction();
    return std::unexpected(result.error());
  }
  Statement stmt(*result);

  const auto& u = completion.update;
  bind_text(stmt.get(), 1, task_status_name(u.status));
  bind_time(stmt.get(), 2, u.next_run_time);
  sqlite3_bind_int(stmt.get(), 3, u.repeats);
  sqlite3_bind_int(stmt.get(), 4, u.retry_failed);
  sqlite3_bind_int(stmt.get(), 5, u.times_failed);
  sqlite3_bind_int(stmt.get(), 6, u.times_run);
  sqlite3_bind_int64(stmt.get(), 7, completion.task_id);
  bind_text(stmt.get(), 8, completion.worker_name);
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    (void)rollback_transaction();
    return fail(Error::DatabaseQueryFailed);
  }

  if (auto r = commit_transaction(); !r)
    return std::unexpected(r.error());
  return u.status;
}

auto TaskRegistry::get_runs(TaskId id) -> Result<std::vector<RunRecord>> {
  constexpr auto sql = R"(
    SELECT id, task_id, status, start_time, stop_time, output, result,
           traceback, worker_name
    FROM task_runs WHERE task_id = ? ORDER BY id;
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  sqlite3_bind_int64(stmt.get(), 1, id);

  std::vector<RunRecord> runs;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    runs.push_back(
        {.id = sqlite3_column_int64(stmt.get(), 0),
         .task_id = sqlite3_column_int64(stmt.get(), 1),
         .status = parse_run_status(col_text(stmt.get(), 2))
                       .value_or(RunStatus::Failed),
         .start_time = col_time(stmt.get(), 3),
         .stop_time = col_time(stmt.get(), 4),
         .output = col_text(stmt.get(), 5),
         .result = col_text(stmt.get(), 6),
         .traceback = col_text(stmt.get(), 7),
         .worker_name = col_text(stmt.get(), 8)});
  }
  return runs;
}

auto TaskRegistry::heartbeat(const WorkerInfo& worker, TimePoint now)
    -> Result<WorkerStatus> {
  {
    constexpr auto sql = R"(
      INSERT INTO workers
        (worker_name, group_names, first_heartbeat, last_heartbeat, status)
      VALUES (?1, ?2, ?3, ?3, 'active')
      ON CONFLICT(worker_name) DO UPDATE SET
        group_names = excluded.group_names,
        last_heartbeat = excluded.last_heartbeat;
    )";
    auto result = prepare(sql);
    if (!result)
      return std::unexpected(result.error());
    Statement stmt(*result);

    nlohmann::json groups = worker.group_names;
    bind_text(stmt.get(), 1, worker.worker_name);
    bind_text(stmt.get(), 2, groups.dump());
    bind_time(stmt.get(), 3, now);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
      log::warn("Heartbeat of {} failed: {}", worker.worker_name,
                sqlite3_errmsg(db_.get()));
      return fail(Error::DatabaseQueryFailed);
    }
  }

  auto info = get_worker(worker.worker_name);
  if (!info)
    return std::unexpected(info.error());
  return info->status;
}

auto TaskRegistry::remove_worker(std::string_view worker_name)
    -> Result<void> {
  constexpr auto sql = "DELETE FROM workers WHERE worker_name = ?;";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, worker_name);
  return sqlite3_step(stmt.get()) == SQLITE_DONE
             ? ok()
             : fail(Error::DatabaseQueryFailed);
}

auto TaskRegistry::set_worker_status(std::string_view worker_name,
                                     WorkerStatus status) -> Result<void> {
  constexpr auto sql = "UPDATE workers SET status = ? WHERE worker_name = ?;";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, worker_status_name(status));
  bind_text(stmt.get(), 2, worker_name);
  if (sqlite3_step(stmt.get()) != SQLITE_DONE)
    return fail(Error::DatabaseQueryFailed);
  if (changes() == 0)
    return fail(Error::NotFound);
  return ok();
}

auto TaskRegistry::get_worker(std::string_view worker_name)
    -> Result<WorkerInfo> {
  constexpr auto sql = R"(
    SELECT worker_name, group_names, first_heartbeat, last_heartbeat, status
    FROM workers WHERE worker_name = ?;
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, worker_name);
  if (sqlite3_step(stmt.get()) != SQLITE_ROW)
    return fail(Error::NotFound);
  return read_worker(stmt.get());
}

auto TaskRegistry::list_workers() -> Result<std::vector<WorkerInfo>> {
  constexpr auto sql = R"(
    SELECT worker_name, group_names, first_heartbeat, last_heartbeat, status
    FROM workers ORDER BY worker_name;
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  std::vector<WorkerInfo> workers;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    workers.push_back(read_worker(stmt.get()));
  }
  return workers;
}

auto TaskRegistry::reclaim_stale(TimePoint now,
                                 std::chrono::milliseconds stale_after,
                                 std::string_view self_name)
    -> Result<ReclaimResult> {
  ReclaimResult reclaimed;

  if (auto r = begin_transaction(); !r)
    return std::unexpected(r.error());

  auto run_step = [&](const char* sql, auto bind) -> Result<int> {
    auto result = prepare(sql);
    if (!result)
      return std::unexpected(result.error());
    Statement stmt(*result);
    bind(stmt.get());
    if (sqlite3_step(stmt.get()) != SQLITE_DONE)
      return fail(Error::DatabaseQueryFailed);
    return changes();
  };

  auto removed = run_step(
      "DELETE FROM workers WHERE last_heartbeat < ? AND worker_name <> ?;",
      [&](sqlite3_stmt* s) {
        bind_time(s, 1, now - stale_after);
        bind_text(s, 2, self_name);
      });
  if (!removed) {
    (void)rollback_transaction();
    return std::unexpected(removed.error());
  }
  reclaimed.workers_removed = *removed;

  auto runs = run_step(R"(
    UPDATE task_runs SET status = 'failed', stop_time = ?, traceback = ?
    WHERE status = 'running'
      AND worker_name NOT IN (SELECT worker_name FROM workers);
  )",
                       [&](sqlite3_stmt* s) {
                         bind_time(s, 1, now);
                         bind_text(s, 2, kWorkerLost);
                       });
  if (!runs) {
    (void)rollback_transaction();
    return std::unexpected(runs.error());
  }
  reclaimed.runs_failed = *runs;

  auto tasks = run_step(R"(
    UPDATE tasks SET status = 'queued', assigned_worker = NULL
    WHERE status IN ('assigned', 'running')
      AND (assigned_worker IS NULL
           OR assigned_worker NOT IN (SELECT worker_name FROM workers));
  )",
                        [](sqlite3_stmt*) {});
  if (!tasks) {
    (void)rollback_transaction();
    return std::unexpected(tasks.error());
  }
  reclaimed.tasks_requeued = *tasks;

  if (auto r = commit_transaction(); !r)
    return std::unexpected(r.error());

  if (reclaimed.workers_removed > 0 || reclaimed.tasks_requeued > 0) {
    log::info("Reclaimed {} stale workers, re-queued {} tasks",
              reclaimed.workers_removed, reclaimed.tasks_requeued);
  }
  return reclaimed;
}

auto TaskRegistry::expire_tasks(TimePoint cutoff) -> Result<int> {
  constexpr auto sql = R"(
    UPDATE tasks SET status = 'expired'
    WHERE status = 'queued' AND stop_time IS NOT NULL
      AND (next_run_time > stop_time OR stop_time < ?);
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_time(stmt.get(), 1, cutoff);
  if (sqlite3_step(stmt.get()) != SQLITE_DONE)
    return fail(Error::DatabaseQueryFailed);
  return changes();
}

auto TaskRegistry::add_dependencies(std::string_view job_name,
                                    std::span<const DependencyEdge> edges)
    -> Result<void> {
  if (auto r = begin_transaction(); !r)
    return r;

  if (auto r = add_dependencies_locked(job_name, edges); !r) {
    (void)rollback_transaction();
    return r;
  }
  return commit_transaction();
}

auto TaskRegistry::add_dependencies_locked(
    std::string_view job_name, std::span<const DependencyEdge> edges)
    -> Result<void> {
  if (edges.empty()) {
    return ok();
  }
  auto job = effective_job(job_name);

  std::unordered_set<TaskId> new_ids;
  for (const auto& edge : edges) {
    new_ids.insert(edge.predecessor);
    new_ids.insert(edge.successor);
  }

  {
    constexpr auto sql = "SELECT 1 FROM tasks WHERE id = ?;";
    auto result = prepare(sql);
    if (!result)
      return std::unexpected(result.error());
    Statement stmt(*result);

    for (TaskId id : new_ids) {
      sqlite3_reset(stmt.get());
      sqlite3_bind_int64(stmt.get(), 1, id);
      if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        log::debug("Dependency names unknown task {}", id);
        return fail(Error::NotFound);
      }
    }
  }

  // Readiness gates on the edges of every job, so a cycle spanning two jobs
  // deadlocks just like one inside a job. Check against all stored edges.
  DependencyGraph graph;
  {
    constexpr auto sql = R"(
      SELECT DISTINCT predecessor_id, successor_id FROM task_deps;
    )";
    auto result = prepare(sql);
    if (!result)
      return std::unexpected(result.error());
    Statement stmt(*result);

    std::vector<DependencyEdge> existing;
    std::vector<TaskId> existing_ids;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
      DependencyEdge edge{.predecessor = sqlite3_column_int64(stmt.get(), 0),
                          .successor = sqlite3_column_int64(stmt.get(), 1)};
      existing_ids.push_back(edge.predecessor);
      existing_ids.push_back(edge.successor);
      existing.push_back(edge);
    }
    if (auto r = graph.add_edges(existing_ids, existing); !r) {
      log::error("Stored dependency edges are invalid: {}",
                 r.error().message());
      return r;
    }
  }

  auto ids = new_ids | std::ranges::to<std::vector>();
  if (auto r = graph.add_edges(ids, edges); !r) {
    log::debug("Rejected dependency batch for '{}': {}", job,
               r.error().message());
    return r;
  }

  constexpr auto sql = R"(
    INSERT OR IGNORE INTO task_deps (job_name, predecessor_id, successor_id)
    VALUES (?, ?, ?);
  )";
  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  for (const auto& edge : edges) {
    sqlite3_reset(stmt.get());
    bind_text(stmt.get(), 1, job);
    sqlite3_bind_int64(stmt.get(), 2, edge.predecessor);
    sqlite3_bind_int64(stmt.get(), 3, edge.successor);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
      return fail(Error::DatabaseQueryFailed);
    }
  }
  return ok();
}

auto TaskRegistry::dependency_snapshot() -> Result<DependencySnapshot> {
  DependencySnapshot snapshot;

  std::map<std::string, std::vector<DependencyEdge>, std::less<>> by_job;
  {
    constexpr auto sql = R"(
      SELECT job_name, predecessor_id, successor_id FROM task_deps;
    )";
    auto result = prepare(sql);
    if (!result)
      return std::unexpected(result.error());
    Statement stmt(*result);

    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
      by_job[col_text(stmt.get(), 0)].push_back(
          {.predecessor = sqlite3_column_int64(stmt.get(), 1),
           .successor = sqlite3_column_int64(stmt.get(), 2)});
    }
  }

  for (const auto& [job, edges] : by_job) {
    std::vector<TaskId> ids;
    for (const auto& edge : edges) {
      ids.push_back(edge.predecessor);
      ids.push_back(edge.successor);
    }
    if (auto r = snapshot.graphs.add_edges(job, ids, edges); !r) {
      log::error("Stored dependency graph '{}' is invalid: {}", job,
                 r.error().message());
      return std::unexpected(r.error());
    }
  }

  constexpr auto sql = R"(
    SELECT task_id, MAX(stop_time), MAX(start_time) FROM task_runs
    WHERE status = 'completed'
      AND (task_id IN (SELECT predecessor_id FROM task_deps)
           OR task_id IN (SELECT successor_id FROM task_deps))
    GROUP BY task_id;
  )";
  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    TaskId id = sqlite3_column_int64(stmt.get(), 0);
    snapshot.last_completed_stop[id] = col_time(stmt.get(), 1);
    snapshot.last_completed_start[id] = col_time(stmt.get(), 2);
  }
  return snapshot;
}

auto DependencySnapshot::completed_for(TaskId successor) const
    -> CompletedSet {
  TimePoint since{};
  if (auto it = last_completed_start.find(successor);
      it != last_completed_start.end()) {
    since = it->second;
  }

  CompletedSet completed;
  for (const auto& [id, stop] : last_completed_stop) {
    if (stop > since) {
      completed.insert(id);
    }
  }
  return completed;
}

}  // namespace cronwork
