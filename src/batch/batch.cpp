// ==============================================================================
// batch.cpp - Batch Processor
// ==============================================================================

#include "logveil/batch.hpp"

#include "logveil/platform.hpp"

#include <algorithm>
#include <atomic>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace logveil::batch {

namespace fs = std::filesystem;

// ============================================================================
// BackendKind
// ============================================================================

BackendKind parse_backend(std::string_view s) {
    if (s == "auto") {
        return BackendKind::Auto;
    }
    if (s == "sequential") {
        return BackendKind::Sequential;
    }
    if (s == "parallel") {
        return BackendKind::Parallel;
    }
    throw std::invalid_argument("unknown engine '" + std::string(s) +
                                "', must be: auto, sequential or parallel");
}

const char* to_string(BackendKind kind) {
    switch (kind) {
    case BackendKind::Auto:
        return "auto";
    case BackendKind::Sequential:
        return "sequential";
    case BackendKind::Parallel:
        return "parallel";
    }
    return "auto";
}

namespace {

engine::UnitKind unit_kind(io::DocumentKind kind) {
    switch (kind) {
    case io::DocumentKind::Text:
        return engine::UnitKind::Line;
    case io::DocumentKind::Json:
    case io::DocumentKind::Jsonl:
        return engine::UnitKind::Json;
    case io::DocumentKind::Yaml:
        return engine::UnitKind::Yaml;
    }
    return engine::UnitKind::Line;
}

/// Временный файл результата: удаляется, если не был опубликован
class TempOutput {
public:
    explicit TempOutput(const fs::path& target)
        : target_(target), temp_(platform::make_sibling_temp_file(target)) {
        stream_.open(temp_, std::ios::binary | std::ios::trunc);
        if (!stream_.is_open()) {
            discard();
            throw std::runtime_error("failed to open temporary file for " +
                                     platform::path_to_utf8(target));
        }
    }

    TempOutput(const TempOutput&) = delete;
    TempOutput& operator=(const TempOutput&) = delete;

    ~TempOutput() { discard(); }

    std::ofstream& stream() { return stream_; }

    /// Закрыть и переименовать на место цели
    /// @throws std::runtime_error при ошибке записи или переименования
    void publish(const std::optional<fs::perms>& perms) {
        stream_.flush();
        bool write_failed = !stream_;
        stream_.close();
        if (write_failed || stream_.fail()) {
            throw std::runtime_error("failed to write " + platform::path_to_utf8(target_));
        }

        std::error_code ec;
        if (perms.has_value()) {
            fs::permissions(temp_, *perms, ec);
        }
        fs::rename(temp_, target_, ec);
        if (ec) {
            throw std::runtime_error("failed to replace " + platform::path_to_utf8(target_) +
                                     " - " + ec.message());
        }
        published_ = true;
    }

private:
    void discard() {
        if (published_) {
            return;
        }
        if (stream_.is_open()) {
            stream_.close();
        }
        std::error_code ec;
        fs::remove(temp_, ec);
    }

    fs::path target_;
    fs::path temp_;
    std::ofstream stream_;
    bool published_ = false;
};

void fill_report(FileReport& report, const Options& opt, const io::Record& rec,
                 const trace::SanitizedResult& result) {
    ++report.records;
    if (result.changed()) {
        ++report.changed_records;
        report.redactions += result.traces.size();
        if (opt.preview) {
            report.previews.push_back(Preview{rec.line, rec.text, result.text});
        }
    }
}

}  // namespace

// ============================================================================
// process_file
// ============================================================================

FileReport process_file(const FileJob& job, const Options& opt, trace::TraceAggregator& traces) {
    FileReport report;
    report.input = job.input;
    const std::string source = platform::path_to_utf8(job.input);

    try {
        if (!job.profile) {
            throw std::invalid_argument("no profile for " + source);
        }
        engine::Engine engine(job.profile);

        auto opened = io::Reader::open(job.input, job.kind);
        if (!opened.ok) {
            report.error = opened.error.format();
            return report;
        }
        io::Reader& reader = *opened.reader;

        std::optional<fs::path> target;
        if (!opt.dry_run) {
            if (opt.inplace) {
                target = job.input;
            } else if (job.output.has_value()) {
                target = job.output;
            }
        }

        std::unique_ptr<TempOutput> temp;
        if (target.has_value()) {
            std::error_code ec;
            if (target->has_parent_path()) {
                fs::create_directories(target->parent_path(), ec);
            }
            temp = std::make_unique<TempOutput>(*target);
        }

        std::vector<trace::RedactionTrace> local;
        std::vector<trace::Note> notes;
        const engine::UnitKind kind = unit_kind(job.kind);

        io::Record rec;
        while (true) {
            if (opt.should_cancel && opt.should_cancel()) {
                report.cancelled = true;
                report.error = "cancelled";
                return report;
            }
            if (!reader.next(rec)) {
                break;
            }

            engine::Unit unit{kind, rec.text, source, rec.line};
            auto result = engine.redact(unit);
            fill_report(report, opt, rec, result);

            if (temp) {
                temp->stream() << result.text << rec.ending;
            }
            if (opt.keep_content) {
                report.content += result.text;
                report.content += rec.ending;
            }

            std::move(result.traces.begin(), result.traces.end(), std::back_inserter(local));
            std::move(result.notes.begin(), result.notes.end(), std::back_inserter(notes));
        }

        if (const auto* err = reader.last_error()) {
            report.error = err->format();
            return report;
        }

        if (temp) {
            std::optional<fs::perms> perms;
            if (opt.inplace) {
                std::error_code ec;
                auto status = fs::status(job.input, ec);
                if (!ec) {
                    perms = status.permissions();
                }
                if (opt.backup) {
                    fs::path bak = job.input;
                    bak += ".bak";
                    fs::copy_file(job.input, bak, fs::copy_options::overwrite_existing, ec);
                    if (ec) {
                        throw std::runtime_error("failed to write backup " +
                                                 platform::path_to_utf8(bak) + " - " +
                                                 ec.message());
                    }
                }
            }
            temp->publish(perms);
            report.written = target;
        }

        report.notes = notes;
        traces.append(std::move(local), std::move(notes));
        report.ok = true;
    } catch (const std::exception& e) {
        report.error = e.what();
    }
    return report;
}

// ============================================================================
// Backends
// ============================================================================

std::vector<FileReport> SequentialBackend::run(const std::vector<FileJob>& jobs,
                                               const Options& opt,
                                               trace::TraceAggregator& traces) {
    std::vector<FileReport> reports;
    reports.reserve(jobs.size());
    for (const auto& job : jobs) {
        reports.push_back(process_file(job, opt, traces));
    }
    return reports;
}

ThreadPoolBackend::ThreadPoolBackend(std::size_t threads) : threads_(threads) {
    if (threads_ == 0) {
        threads_ = std::max<std::size_t>(1, std::thread::hardware_concurrency());
    }
}

std::vector<FileReport> ThreadPoolBackend::run(const std::vector<FileJob>& jobs,
                                               const Options& opt,
                                               trace::TraceAggregator& traces) {
    std::vector<FileReport> reports(jobs.size());
    std::atomic<std::size_t> next{0};

    auto worker = [&]() {
        while (true) {
            std::size_t index = next.fetch_add(1);
            if (index >= jobs.size()) {
                return;
            }
            // Каждый слот пишется ровно одним потоком
            reports[index] = process_file(jobs[index], opt, traces);
        }
    };

    std::size_t count = std::min(threads_, jobs.size());
    std::vector<std::thread> threads;
    threads.reserve(count);
    for (std::size_t t = 0; t < count; ++t) {
        threads.emplace_back(worker);
    }
    for (auto& thread : threads) {
        thread.join();
    }
    return reports;
}

std::unique_ptr<Backend> make_backend(BackendKind kind, std::size_t threads,
                                      std::size_t job_count) {
    switch (kind) {
    case BackendKind::Sequential:
        return std::make_unique<SequentialBackend>();
    case BackendKind::Parallel:
        return std::make_unique<ThreadPoolBackend>(threads);
    case BackendKind::Auto:
        if (job_count > 1 && threads != 1) {
            return std::make_unique<ThreadPoolBackend>(threads);
        }
        return std::make_unique<SequentialBackend>();
    }
    return std::make_unique<SequentialBackend>();
}

// ============================================================================
// redact_stream
// ============================================================================

StreamStats redact_stream(std::istream& in, std::ostream& out, engine::ProfileStore& store,
                          const StreamOptions& opt, trace::TraceAggregator* traces) {
    StreamStats stats;
    auto reader = io::Reader::from_stream(in, opt.source);

    io::Record rec;
    while (true) {
        if (opt.should_cancel && opt.should_cancel()) {
            stats.cancelled = true;
            break;
        }
        if (!reader->next(rec)) {
            break;
        }

        if (opt.should_reload && opt.reload && opt.should_reload()) {
            auto loaded = opt.reload();
            if (loaded.ok) {
                store.publish(loaded.profile);
                ++stats.reloads;
                if (opt.on_reloaded) {
                    opt.on_reloaded(*loaded.profile);
                }
            } else {
                ++stats.failed_reloads;
                if (opt.on_reload_failed) {
                    opt.on_reload_failed(loaded.error);
                }
            }
        }

        // Снимок на строку: перезагрузка не меняет профиль посреди строки
        engine::Engine engine(store.snapshot());
        auto result = engine.redact_line(rec.text, opt.source, rec.line);

        ++stats.lines;
        if (result.changed()) {
            ++stats.changed_lines;
            stats.redactions += result.traces.size();
        }

        out << result.text << rec.ending;
        out.flush();
        if (!out) {
            throw std::runtime_error("failed to write output");
        }
        for (const auto& t : result.traces) {
            trace::tally(stats.summary, t);
        }
        stats.summary.notes += result.notes.size();
        if (opt.on_note) {
            for (const auto& note : result.notes) {
                opt.on_note(note);
            }
        }
        if (traces != nullptr) {
            traces->append(std::move(result.traces));
        }
    }

    if (const auto* err = reader->last_error()) {
        throw std::runtime_error(err->format());
    }
    return stats;
}

}  // namespace logveil::batch
