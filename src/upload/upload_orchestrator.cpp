// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file upload_orchestrator.cpp
 * @brief Implementation of the per-file upload state machine
 */

#include "kcenon/storage_transfer/upload/upload_orchestrator.h"
#include "kcenon/storage_transfer/core/logging.h"

#include <algorithm>
#include <atomic>
#include <mutex>

namespace kcenon::storage_transfer {

namespace {

// Direct transfer fills 0-90%, finalization the rest
constexpr double transfer_share = 90.0;
constexpr double finalizing_progress = 95.0;
constexpr double completed_progress = 100.0;

}  // namespace

struct upload_orchestrator::impl {
    session_id id;
    std::string bucket_id;
    file_ref file;
    upload_options options;
    orchestrator_dependencies deps;

    mutable std::mutex mutex;
    upload_session session;
    bool running = false;
    bool progress_reported = false;

    cancellation_token token;
    std::atomic<bool> error_reported{false};
    std::size_t expired_restarts = 0;
    std::chrono::steady_clock::time_point started_at = std::chrono::steady_clock::now();

    impl(session_id sid, std::string bucket, file_ref f, upload_options opts,
         orchestrator_dependencies d)
        : id(std::move(sid)),
          bucket_id(std::move(bucket)),
          file(std::move(f)),
          options(std::move(opts)),
          deps(std::move(d)) {
        session.id = id;
        session.file = file;
        session.bucket_id = bucket_id;
        session.status = upload_status::pending;
    }

    /**
     * @brief Marks an operation as running for its lifetime
     *
     * A cancel() that arrived while the operation was running but after its
     * last cancellation check is completed here.
     */
    class step_scope {
    public:
        explicit step_scope(impl& self) : self_(self) {}
        ~step_scope() {
            bool cancel_pending = false;
            {
                std::lock_guard<std::mutex> lock(self_.mutex);
                self_.running = false;
                cancel_pending =
                    self_.token.is_cancelled() && !is_terminal_status(self_.session.status);
            }
            if (cancel_pending) {
                static_cast<void>(self_.finish_cancelled());
            }
        }

        step_scope(const step_scope&) = delete;
        auto operator=(const step_scope&) -> step_scope& = delete;

    private:
        impl& self_;
    };

    auto begin(upload_status expected) -> result<void> {
        std::lock_guard<std::mutex> lock(mutex);
        if (running) {
            return unexpected(error(error_kind::validation, "Upload step already in progress"));
        }
        if (session.status != expected) {
            return unexpected(error(error_kind::validation,
                                    std::string("Operation not valid in state ") +
                                        to_string(session.status)));
        }
        running = true;
        return {};
    }

    [[nodiscard]] auto content_type() const -> std::string {
        if (options.content_type && !options.content_type->empty()) {
            return *options.content_type;
        }
        return file.content_type().empty() ? "application/octet-stream" : file.content_type();
    }

    [[nodiscard]] auto digest() const -> std::optional<std::string> {
        std::lock_guard<std::mutex> lock(mutex);
        return session.client_digest;
    }

    [[nodiscard]] auto log_context() const -> transfer_log_context {
        transfer_log_context ctx;
        ctx.session_id = id.value;
        ctx.bucket_id = bucket_id;
        ctx.filename = file.name();
        ctx.file_size = file.size();
        return ctx;
    }

    void notify_progress(double percent, uint64_t loaded, uint64_t total) {
        if (options.callbacks.on_progress) {
            options.callbacks.on_progress(percent, loaded, total);
        }
    }

    /**
     * @brief Record progress if it moves forward
     * @return true when the value was accepted
     */
    auto advance_progress(double percent) -> bool {
        std::lock_guard<std::mutex> lock(mutex);
        if (progress_reported && percent <= session.progress_percent) {
            return false;
        }
        progress_reported = true;
        session.progress_percent = percent;
        return true;
    }

    void report_progress(double percent, uint64_t loaded, uint64_t total) {
        if (advance_progress(percent)) {
            notify_progress(percent, loaded, total);
        }
    }

    void transition(upload_status next, std::optional<double> progress = std::nullopt) {
        bool progress_accepted = false;
        upload_session snap;
        {
            std::lock_guard<std::mutex> lock(mutex);
            session.status = next;
            if (progress && (!progress_reported || *progress > session.progress_percent)) {
                progress_reported = true;
                session.progress_percent = *progress;
                progress_accepted = true;
            }
            snap = session;
        }

        auto ctx = log_context();
        ctx.status = to_string(next);
        ST_LOG_DEBUG_CTX(log_category::orchestrator, "Upload state changed", ctx);

        if (options.callbacks.on_state_change) {
            options.callbacks.on_state_change(snap);
        }
        if (progress_accepted) {
            notify_progress(*progress, next == upload_status::uploading ? 0 : file.size(),
                            file.size());
        }
    }

    auto fail(error err) -> unexpected {
        upload_session snap;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (is_terminal_status(session.status)) {
                return unexpected(session.last_error.value_or(std::move(err)));
            }
            session.status = upload_status::error;
            session.last_error = err;
            snap = session;
        }

        auto ctx = log_context();
        ctx.status = to_string(upload_status::error);
        ctx.error_kind = std::string(to_string(err.kind));
        ctx.error_message = err.message;
        if (err.kind == error_kind::cancelled) {
            ST_LOG_INFO_CTX(log_category::orchestrator, "Upload cancelled", ctx);
        } else {
            ST_LOG_ERROR_CTX(log_category::orchestrator, "Upload failed", ctx);
        }

        if (options.callbacks.on_state_change) {
            options.callbacks.on_state_change(snap);
        }
        if (!error_reported.exchange(true) && options.callbacks.on_error) {
            options.callbacks.on_error(err);
        }
        return unexpected(std::move(err));
    }

    auto finish_cancelled() -> unexpected {
        std::optional<std::string> upload_id;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!is_terminal_status(session.status)) {
                upload_id = session.server_upload_id;
            }
        }

        if (upload_id && deps.api) {
            auto released = deps.api->cancel_upload(*upload_id);
            if (!released) {
                ST_LOG_WARN(log_category::orchestrator,
                            "Failed to release upload session " + *upload_id + ": " +
                                released.error().message);
            }
        }
        return fail(error(error_kind::cancelled, "Upload cancelled"));
    }

    auto fail_or_cancel(const error& err) -> unexpected {
        if (token.is_cancelled() || err.kind == error_kind::cancelled) {
            return finish_cancelled();
        }
        return fail(err);
    }

    [[nodiscard]] auto hooks() -> retry_hooks {
        auto h = retry_hooks::with_token(token);
        h.on_retry = [this](const error& err, std::size_t attempt,
                                std::chrono::milliseconds delay) {
            {
                std::lock_guard<std::mutex> lock(mutex);
                ++session.retry_count;
            }

            auto ctx = log_context();
            ctx.attempt = static_cast<uint32_t>(attempt);
            ctx.delay_ms = static_cast<uint64_t>(delay.count());
            ctx.error_kind = std::string(to_string(err.kind));
            ctx.error_message = err.message;
            ST_LOG_WARN_CTX(log_category::retry, "Retrying upload step", ctx);

            if (options.callbacks.on_retry) {
                options.callbacks.on_retry(err, attempt, delay);
            }
        };
        return h;
    }

    /**
     * @brief Whether an expired signed URL should restart initiation
     */
    auto restart_after_expiry(const error& err) -> bool {
        if (err.kind != error_kind::signed_url_expired || token.is_cancelled()) {
            return false;
        }
        if (!should_retry(err.kind, expired_restarts, deps.policies.upload)) {
            return false;
        }
        ++expired_restarts;
        {
            std::lock_guard<std::mutex> lock(mutex);
            ++session.retry_count;
            session.signed_url.reset();
            session.url_expires_at.reset();
        }

        auto ctx = log_context();
        ctx.attempt = static_cast<uint32_t>(expired_restarts);
        ctx.error_kind = std::string(to_string(err.kind));
        ST_LOG_INFO_CTX(log_category::orchestrator,
                        "Signed URL expired, requesting a fresh upload session", ctx);

        if (options.callbacks.on_retry) {
            options.callbacks.on_retry(err, expired_restarts, std::chrono::milliseconds{0});
        }
        return true;
    }

    auto detect_duplicate() -> result<std::optional<duplicate_info>> {
        transition(upload_status::hashing);

        hash_request request;
        request.cancel = token;
        auto hashed = deps.hasher->hash(file, request);
        if (!hashed) {
            if (token.is_cancelled() || hashed.error().kind == error_kind::cancelled) {
                return finish_cancelled();
            }
            ST_LOG_WARN(log_category::orchestrator,
                        "Hashing skipped for " + file.name() + ": " + hashed.error().message);
            return std::optional<duplicate_info>{};
        }

        {
            std::lock_guard<std::mutex> lock(mutex);
            session.client_digest = hashed.value();
        }
        transition(upload_status::checking_duplicates);

        auto info = deps.duplicates->check_duplicate(bucket_id, hashed.value(), hooks());
        if (!info) {
            if (token.is_cancelled() || info.error().kind == error_kind::cancelled) {
                return finish_cancelled();
            }
            ST_LOG_WARN(log_category::orchestrator,
                        "Duplicate check failed, uploading anyway: " + info.error().message);
            return std::optional<duplicate_info>{};
        }
        if (!info.value().is_duplicate) {
            return std::optional<duplicate_info>{};
        }
        return std::optional<duplicate_info>{info.value()};
    }

    auto upload_from_initiate() -> result<upload_outcome> {
        const auto client_hash = digest();

        while (true) {
            transition(upload_status::initiating);

            initiate_request init;
            init.filename = file.name();
            init.size = file.size();
            init.content_type = content_type();
            init.client_hash = client_hash;

            auto grant = execute_with_retry(
                [&] { return deps.api->initiate_upload(bucket_id, init); }, deps.policies.api,
                hooks());
            if (!grant) {
                return fail_or_cancel(grant.error());
            }
            const auto& issued = grant.value();
            {
                std::lock_guard<std::mutex> lock(mutex);
                session.server_upload_id = issued.upload_id;
                session.signed_url = issued.signed_url;
                session.required_headers = issued.required_headers;
                session.url_expires_at = issued.expires_at;
            }
            if (token.is_cancelled()) {
                return finish_cancelled();
            }

            transition(upload_status::uploading, 0.0);

            auto on_transfer = [this](uint64_t loaded, uint64_t total) {
                const double percent =
                    total == 0 ? transfer_share
                               : std::min(transfer_share,
                                          static_cast<double>(loaded) * transfer_share /
                                              static_cast<double>(total));
                report_progress(percent, loaded, total);
            };

            auto put = execute_with_retry(
                [&] {
                    return deps.transfer->put(issued.signed_url, file, issued.required_headers,
                                              on_transfer, token);
                },
                deps.policies.direct_transfer, hooks());
            if (!put) {
                if (restart_after_expiry(put.error())) {
                    continue;
                }
                return fail_or_cancel(put.error());
            }

            transition(upload_status::finalizing, finalizing_progress);

            complete_request done;
            done.etag = put.value().etag;
            done.actual_size = file.size();
            done.client_hash = client_hash;
            done.enable_versioning = options.enable_versioning;

            auto record = execute_with_retry(
                [&] { return deps.api->complete_upload(issued.upload_id, done); },
                deps.policies.api, hooks());
            if (!record) {
                if (restart_after_expiry(record.error())) {
                    continue;
                }
                return fail_or_cancel(record.error());
            }

            if (record.value().hash_verification && !record.value().hash_verification->matches) {
                ST_LOG_WARN(log_category::orchestrator,
                            "Server digest differs from client digest for " + file.name());
            }

            return complete(record.value());
        }
    }

    auto complete(const file_record& record, std::optional<std::string> reused = std::nullopt)
        -> result<upload_outcome> {
        std::optional<duplicate_info> duplicate;
        {
            std::lock_guard<std::mutex> lock(mutex);
            session.result = record;
            duplicate = session.duplicate;
        }
        transition(upload_status::completed, completed_progress);

        auto ctx = log_context();
        ctx.status = to_string(upload_status::completed);
        ctx.duration_ms = static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started_at)
                .count());
        ST_LOG_INFO_CTX(log_category::orchestrator,
                        reused ? "Upload resolved to existing file" : "Upload completed", ctx);

        if (options.callbacks.on_complete) {
            options.callbacks.on_complete(record);
        }

        upload_outcome outcome;
        outcome.status = upload_status::completed;
        outcome.record = record;
        outcome.duplicate = std::move(duplicate);
        outcome.reused_file_id = std::move(reused);
        return outcome;
    }
};

upload_orchestrator::upload_orchestrator(session_id id,
                                         std::string bucket_id,
                                         file_ref file,
                                         upload_options options,
                                         orchestrator_dependencies deps)
    : impl_(std::make_unique<impl>(std::move(id), std::move(bucket_id), std::move(file),
                                   std::move(options), std::move(deps))) {}

upload_orchestrator::~upload_orchestrator() = default;

auto upload_orchestrator::run() -> result<upload_outcome> {
    auto started = impl_->begin(upload_status::pending);
    if (!started) {
        return unexpected(started.error());
    }
    impl::step_scope scope(*impl_);

    if (!impl_->deps.api || !impl_->deps.transfer) {
        return impl_->fail(error(error_kind::internal, "Upload dependencies not configured"));
    }
    if (impl_->bucket_id.empty()) {
        return impl_->fail(error(error_kind::validation, "Bucket id is required"));
    }
    if (impl_->token.is_cancelled()) {
        return impl_->finish_cancelled();
    }

    impl_->started_at = std::chrono::steady_clock::now();
    auto ctx = impl_->log_context();
    ST_LOG_INFO_CTX(log_category::orchestrator, "Upload started", ctx);

    const bool try_dedup = !impl_->options.skip_duplicate_check && impl_->deps.hasher &&
                           impl_->deps.duplicates &&
                           impl_->deps.hasher->should_hash(impl_->file, hash_mode::pre_upload);
    if (try_dedup) {
        auto duplicate = impl_->detect_duplicate();
        if (!duplicate) {
            return unexpected(duplicate.error());
        }
        if (duplicate.value()) {
            const auto& info = *duplicate.value();
            {
                std::lock_guard<std::mutex> lock(impl_->mutex);
                impl_->session.duplicate = info;
            }
            impl_->transition(upload_status::duplicate_found);
            if (impl_->options.callbacks.on_duplicate) {
                impl_->options.callbacks.on_duplicate(info);
            }

            upload_outcome outcome;
            outcome.status = upload_status::duplicate_found;
            outcome.duplicate = info;
            return outcome;
        }
    }

    return impl_->upload_from_initiate();
}

auto upload_orchestrator::continue_anyway() -> result<upload_outcome> {
    auto started = impl_->begin(upload_status::duplicate_found);
    if (!started) {
        return unexpected(started.error());
    }
    impl::step_scope scope(*impl_);

    if (impl_->token.is_cancelled()) {
        return impl_->finish_cancelled();
    }
    ST_LOG_INFO(log_category::orchestrator,
                "Uploading " + impl_->file.name() + " despite existing duplicate");
    return impl_->upload_from_initiate();
}

auto upload_orchestrator::reuse_existing(std::optional<std::string> file_id)
    -> result<upload_outcome> {
    auto started = impl_->begin(upload_status::duplicate_found);
    if (!started) {
        return unexpected(started.error());
    }
    impl::step_scope scope(*impl_);

    if (impl_->token.is_cancelled()) {
        return impl_->finish_cancelled();
    }

    std::optional<duplicate_info> duplicate;
    std::optional<std::string> digest;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        duplicate = impl_->session.duplicate;
        digest = impl_->session.client_digest;
    }
    if (!duplicate || duplicate->existing_files.empty()) {
        return unexpected(error(error_kind::validation, "No existing file to reuse"));
    }

    const auto& candidates = duplicate->existing_files;
    auto match = candidates.begin();
    if (file_id) {
        match = std::find_if(candidates.begin(), candidates.end(),
                             [&](const file_summary& s) { return s.id == *file_id; });
        if (match == candidates.end()) {
            return unexpected(error(error_kind::validation,
                                    "File " + *file_id + " is not among the duplicates"));
        }
    }

    file_record record;
    record.id = match->id;
    record.bucket_id = impl_->bucket_id;
    record.original_name = match->original_name;
    record.mime_type = impl_->content_type();
    record.size = match->size;
    record.file_hash = digest.value_or("");
    record.is_public = match->is_public;
    record.version = match->version;
    record.created_at = match->created_at;

    return impl_->complete(record, match->id);
}

void upload_orchestrator::cancel() {
    impl_->token.cancel();
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (impl_->running || is_terminal_status(impl_->session.status)) {
            return;
        }
    }
    static_cast<void>(impl_->finish_cancelled());
}

auto upload_orchestrator::snapshot() const -> upload_session {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->session;
}

auto upload_orchestrator::status() const -> upload_status {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->session.status;
}

auto upload_orchestrator::id() const -> const session_id& { return impl_->id; }

}  // namespace kcenon::storage_transfer
