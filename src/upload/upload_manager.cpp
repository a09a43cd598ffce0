// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file upload_manager.cpp
 * @brief Implementation of upload_manager
 */

#include "kcenon/storage_transfer/upload/upload_manager.h"
#include "kcenon/storage_transfer/core/logging.h"
#include "kcenon/storage_transfer/upload/file_validation.h"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <future>
#include <map>
#include <mutex>
#include <numeric>
#include <vector>

namespace kcenon::storage_transfer {

namespace {

auto join_errors(const std::vector<std::string>& errors) -> std::string {
    std::string joined;
    for (const auto& message : errors) {
        if (!joined.empty()) {
            joined += "; ";
        }
        joined += message;
    }
    return joined;
}

auto ready_outcome(result<upload_outcome> value) -> std::shared_future<result<upload_outcome>> {
    std::promise<result<upload_outcome>> promise;
    promise.set_value(std::move(value));
    return promise.get_future().share();
}

// Set while a worker runs an orchestrator step. A step future must not be
// released on the thread that runs it: with std::async that joins itself.
thread_local bool inside_step = false;

auto is_ready(const std::future<void>& task) -> bool {
    return !task.valid() || task.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

}  // namespace

struct upload_manager::impl {
    using step = std::function<result<upload_outcome>(upload_orchestrator&)>;

    struct entry {
        std::shared_ptr<upload_orchestrator> orchestrator;
        std::shared_future<result<upload_outcome>> outcome;
        std::vector<std::future<void>> tasks;
    };

    orchestrator_dependencies deps;
    std::shared_ptr<adapters::transfer_thread_pool_interface> pool;
    std::optional<validation_options> validation;

    mutable std::mutex mutex;
    std::map<session_id, entry> sessions;
    std::vector<std::future<void>> retired;  ///< released from inside a step

    std::mutex listeners_mutex;
    std::map<subscription_id, session_listener> listeners;
    subscription_id next_subscription = 1;

    void notify(const upload_session& snapshot) {
        std::vector<session_listener> targets;
        {
            std::lock_guard<std::mutex> lock(listeners_mutex);
            targets.reserve(listeners.size());
            for (const auto& [id, listener] : listeners) {
                targets.push_back(listener);
            }
        }
        for (const auto& listener : targets) {
            listener(snapshot);
        }
    }

    auto wrap(upload_options options) -> upload_options {
        auto user = std::move(options.callbacks.on_state_change);
        options.callbacks.on_state_change = [this, user = std::move(user)](
                                                const upload_session& snapshot) {
            if (user) {
                user(snapshot);
            }
            notify(snapshot);
        };
        return options;
    }

    auto precheck(const std::string& bucket_id, const file_ref& file) const -> result<void> {
        if (bucket_id.empty()) {
            return unexpected(error(error_kind::validation, "Bucket id is required"));
        }
        if (validation) {
            auto report = validate_file(file, *validation);
            if (!report.is_valid) {
                ST_LOG_WARN(log_category::manager,
                            "Rejected " + file.name() + ": " + join_errors(report.errors));
                return unexpected(error(error_kind::validation, join_errors(report.errors)));
            }
        }
        return {};
    }

    auto find(const session_id& id) const -> std::shared_ptr<upload_orchestrator> {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = sessions.find(id);
        return it != sessions.end() ? it->second.orchestrator : nullptr;
    }

    static auto unknown_session(const session_id& id) -> error {
        return error(error_kind::not_found, "Unknown upload session: " + id.value);
    }

    /**
     * @brief Drop step futures outside the session lock
     *
     * From a worker the futures are parked until the manager is destroyed,
     * since one of them may belong to the calling thread.
     */
    void release(std::vector<std::future<void>> tasks) {
        if (tasks.empty()) {
            return;
        }
        if (inside_step) {
            std::lock_guard<std::mutex> lock(mutex);
            for (auto& task : tasks) {
                retired.push_back(std::move(task));
            }
            return;
        }
        for (auto& task : tasks) {
            if (task.valid()) {
                task.wait();
            }
        }
    }

    auto launch(const session_id& id, step op, const std::string& lane,
                std::function<void()> on_finished = {}) -> result<void> {
        auto orchestrator = find(id);
        if (!orchestrator) {
            return unexpected(unknown_session(id));
        }

        auto promise = std::make_shared<std::promise<result<upload_outcome>>>();
        auto outcome = promise->get_future().share();
        std::vector<std::future<void>> finished;

        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = sessions.find(id);
            if (it == sessions.end()) {
                return unexpected(unknown_session(id));
            }

            // The previous step may still be unwinding (a decision made from
            // its own callback); its outcome is set only after it returns.
            auto previous = it->second.outcome;
            it->second.outcome = outcome;

            auto& tasks = it->second.tasks;
            for (auto task = tasks.begin(); task != tasks.end();) {
                if (is_ready(*task)) {
                    finished.push_back(std::move(*task));
                    task = tasks.erase(task);
                } else {
                    ++task;
                }
            }

            tasks.push_back(pool->submit_to_lane(
                [orchestrator, promise, previous, op = std::move(op),
                 on_finished = std::move(on_finished)] {
                    inside_step = true;
                    if (previous.valid()) {
                        previous.wait();
                    }
                    try {
                        promise->set_value(op(*orchestrator));
                    } catch (...) {
                        // Callback exceptions surface through wait()
                        promise->set_exception(std::current_exception());
                    }
                    if (on_finished) {
                        on_finished();
                    }
                    inside_step = false;
                },
                lane));
        }

        release(std::move(finished));
        return {};
    }

    auto start(const std::string& bucket_id, file_ref file, upload_options options,
               const std::string& lane, std::function<void()> on_finished = {})
        -> result<session_id> {
        auto checked = precheck(bucket_id, file);
        if (!checked) {
            return unexpected(checked.error());
        }

        auto id = session_id::generate();
        const auto filename = file.name();
        auto orchestrator = std::make_shared<upload_orchestrator>(
            id, bucket_id, std::move(file), wrap(std::move(options)), deps);
        {
            std::lock_guard<std::mutex> lock(mutex);
            sessions.emplace(id, entry{orchestrator, {}, {}});
        }

        auto launched = launch(
            id, [](upload_orchestrator& o) { return o.run(); }, lane, std::move(on_finished));
        if (!launched) {
            return unexpected(launched.error());
        }

        ST_LOG_DEBUG(log_category::manager, "Queued " + filename + " as " + id.value);
        return id;
    }

    auto wait(const session_id& id) -> result<upload_outcome> {
        std::shared_future<result<upload_outcome>> outcome;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = sessions.find(id);
            if (it == sessions.end()) {
                return unexpected(unknown_session(id));
            }
            outcome = it->second.outcome;
        }
        if (!outcome.valid()) {
            return unexpected(error(error_kind::validation, "Session has no scheduled step"));
        }

        try {
            return outcome.get();
        } catch (const std::exception& e) {
            return unexpected(error(error_kind::internal,
                                    std::string("Upload task failed: ") + e.what()));
        }
    }

    auto take_finished(const std::function<bool(const session_id&)>& select) -> std::size_t {
        std::vector<std::future<void>> tasks;
        std::size_t removed = 0;
        {
            std::lock_guard<std::mutex> lock(mutex);
            for (auto it = sessions.begin(); it != sessions.end();) {
                if (select(it->first) && is_terminal_status(it->second.orchestrator->status())) {
                    for (auto& task : it->second.tasks) {
                        tasks.push_back(std::move(task));
                    }
                    it = sessions.erase(it);
                    ++removed;
                } else {
                    ++it;
                }
            }
        }
        release(std::move(tasks));
        return removed;
    }
};

upload_manager::upload_manager(orchestrator_dependencies deps,
                               std::shared_ptr<adapters::transfer_thread_pool_interface> pool,
                               std::optional<validation_options> validation)
    : impl_(std::make_unique<impl>()) {
    impl_->deps = std::move(deps);
    impl_->pool = pool ? std::move(pool) : adapters::transfer_pool_factory::create();
    impl_->validation = std::move(validation);
}

upload_manager::~upload_manager() {
    std::vector<std::shared_ptr<upload_orchestrator>> running;
    std::vector<std::future<void>> tasks;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        for (auto& [id, e] : impl_->sessions) {
            if (!is_terminal_status(e.orchestrator->status())) {
                running.push_back(e.orchestrator);
            }
            for (auto& task : e.tasks) {
                tasks.push_back(std::move(task));
            }
        }
        for (auto& task : impl_->retired) {
            tasks.push_back(std::move(task));
        }
        impl_->retired.clear();
    }
    for (auto& orchestrator : running) {
        orchestrator->cancel();
    }
    for (auto& task : tasks) {
        if (task.valid()) {
            task.wait();
        }
    }
}

auto upload_manager::start_upload(const std::string& bucket_id,
                                  file_ref file,
                                  upload_options options) -> result<session_id> {
    return impl_->start(bucket_id, std::move(file), std::move(options),
                        adapters::pool_lane::upload);
}

auto upload_manager::upload(const std::string& bucket_id,
                            file_ref file,
                            upload_options options) -> result<upload_outcome> {
    auto id = start_upload(bucket_id, std::move(file), std::move(options));
    if (!id) {
        return unexpected(id.error());
    }
    return impl_->wait(id.value());
}

auto upload_manager::upload_batch(const std::string& bucket_id,
                                  std::vector<file_ref> files,
                                  batch_upload_options options) -> batch_upload_result {
    struct batch_state {
        std::mutex mutex;
        std::condition_variable cv;
        std::size_t in_flight = 0;
        std::vector<double> progress;
    };

    const std::size_t count = files.size();
    const std::size_t limit = std::max<std::size_t>(1, options.max_concurrent);
    auto state = std::make_shared<batch_state>();
    state->progress.assign(count, 0.0);

    batch_upload_result out;
    out.items.resize(count);
    std::vector<std::optional<session_id>> ids(count);

    ST_LOG_INFO(log_category::manager,
                "Batch of " + std::to_string(count) + " file(s) to bucket " + bucket_id);

    auto release = [state] {
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            --state->in_flight;
        }
        state->cv.notify_all();
    };

    for (std::size_t i = 0; i < count; ++i) {
        auto& item = out.items[i];
        item.index = i;
        item.filename = files[i].name();

        {
            std::unique_lock<std::mutex> lock(state->mutex);
            state->cv.wait(lock, [&] { return state->in_flight < limit; });
            ++state->in_flight;
        }

        upload_options per_file = options.per_file;
        per_file.callbacks.on_progress =
            [state, i, count, user = options.per_file.callbacks.on_progress,
             batch = options.on_batch_progress](double percent, uint64_t loaded,
                                                uint64_t total) {
                if (user) {
                    user(percent, loaded, total);
                }
                double overall = 0.0;
                {
                    std::lock_guard<std::mutex> lock(state->mutex);
                    state->progress[i] = percent;
                    overall = std::accumulate(state->progress.begin(), state->progress.end(),
                                              0.0) /
                              static_cast<double>(count);
                }
                if (batch) {
                    batch(overall, i);
                }
            };

        auto id = impl_->start(bucket_id, files[i], std::move(per_file),
                               adapters::pool_lane::batch, release);
        if (!id) {
            release();
            item.final_status = upload_status::error;
            item.failure = id.error();
            continue;
        }
        item.id = id.value();
        ids[i] = id.value();
    }

    for (std::size_t i = 0; i < count; ++i) {
        auto& item = out.items[i];
        if (ids[i]) {
            auto outcome = impl_->wait(*ids[i]);
            if (outcome && outcome.value().status == upload_status::duplicate_found &&
                options.reuse_duplicates) {
                outcome = reuse_existing(*ids[i]);
            }

            if (outcome) {
                item.final_status = outcome.value().status;
                item.record = outcome.value().record;
            } else {
                item.final_status = upload_status::error;
                item.failure = outcome.error();
            }
        }

        if (item.final_status == upload_status::completed && item.record) {
            ++out.succeeded;
            if (options.on_file_complete) {
                options.on_file_complete(*item.record, i);
            }
        } else if (item.final_status == upload_status::error) {
            ++out.failed;
            if (options.on_file_error && item.failure) {
                options.on_file_error(*item.failure, i);
            }
        }
    }

    ST_LOG_INFO(log_category::manager,
                "Batch finished: " + std::to_string(out.succeeded) + " succeeded, " +
                    std::to_string(out.failed) + " failed");
    return out;
}

auto upload_manager::continue_anyway(const session_id& id) -> result<void> {
    auto orchestrator = impl_->find(id);
    if (!orchestrator) {
        return unexpected(impl::unknown_session(id));
    }
    if (orchestrator->status() != upload_status::duplicate_found) {
        return unexpected(error(error_kind::validation,
                                std::string("Session is not awaiting a duplicate decision: ") +
                                    to_string(orchestrator->status())));
    }
    return impl_->launch(
        id, [](upload_orchestrator& o) { return o.continue_anyway(); },
        adapters::pool_lane::upload);
}

auto upload_manager::reuse_existing(const session_id& id, std::optional<std::string> file_id)
    -> result<upload_outcome> {
    auto orchestrator = impl_->find(id);
    if (!orchestrator) {
        return unexpected(impl::unknown_session(id));
    }

    auto outcome = orchestrator->reuse_existing(std::move(file_id));
    if (outcome) {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        auto it = impl_->sessions.find(id);
        if (it != impl_->sessions.end()) {
            it->second.outcome = ready_outcome(outcome);
        }
    }
    return outcome;
}

auto upload_manager::cancel(const session_id& id) -> result<void> {
    auto orchestrator = impl_->find(id);
    if (!orchestrator) {
        return unexpected(impl::unknown_session(id));
    }
    orchestrator->cancel();
    return {};
}

auto upload_manager::wait(const session_id& id) -> result<upload_outcome> {
    return impl_->wait(id);
}

auto upload_manager::get_session(const session_id& id) const -> std::optional<upload_session> {
    auto orchestrator = impl_->find(id);
    if (!orchestrator) {
        return std::nullopt;
    }
    return orchestrator->snapshot();
}

auto upload_manager::active_sessions() const -> std::vector<upload_session> {
    std::vector<std::shared_ptr<upload_orchestrator>> all;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        for (const auto& [id, e] : impl_->sessions) {
            all.push_back(e.orchestrator);
        }
    }

    std::vector<upload_session> active;
    for (const auto& orchestrator : all) {
        auto snapshot = orchestrator->snapshot();
        if (!is_terminal_status(snapshot.status)) {
            active.push_back(std::move(snapshot));
        }
    }
    return active;
}

auto upload_manager::remove(const session_id& id) -> bool {
    return impl_->take_finished([&](const session_id& candidate) { return candidate == id; }) > 0;
}

auto upload_manager::clear_finished() -> std::size_t {
    return impl_->take_finished([](const session_id&) { return true; });
}

auto upload_manager::get_upload_status(const session_id& id) -> result<upload_status_info> {
    auto orchestrator = impl_->find(id);
    if (!orchestrator) {
        return unexpected(impl::unknown_session(id));
    }

    auto snapshot = orchestrator->snapshot();
    if (!snapshot.server_upload_id) {
        return unexpected(error(error_kind::validation, "Upload session not yet initiated"));
    }

    const auto upload_id = *snapshot.server_upload_id;
    return execute_with_retry([&] { return impl_->deps.api->get_upload_status(upload_id); },
                              impl_->deps.policies.api);
}

auto upload_manager::subscribe(session_listener listener) -> subscription_id {
    std::lock_guard<std::mutex> lock(impl_->listeners_mutex);
    const auto id = impl_->next_subscription++;
    impl_->listeners.emplace(id, std::move(listener));
    return id;
}

auto upload_manager::unsubscribe(subscription_id id) -> bool {
    std::lock_guard<std::mutex> lock(impl_->listeners_mutex);
    return impl_->listeners.erase(id) > 0;
}

auto upload_manager::session_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->sessions.size();
}

}  // namespace kcenon::storage_transfer
