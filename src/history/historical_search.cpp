#include "dcm/history/historical_search.h"

#include <algorithm>
#include <future>
#include <system_error>
#include <tuple>

namespace dcm::history {

namespace fs = std::filesystem;

std::string_view to_string(LookupStrategy strategy) {
  switch (strategy) {
    case LookupStrategy::kExact:
      return "exact";
    case LookupStrategy::kFuzzy:
      return "fuzzy";
    case LookupStrategy::kNone:
      break;
  }
  return "none";
}

HistoricalSearch::HistoricalSearch(const resolve::IdentityResolver& resolver, FolderLayout layout,
                                   HistoricalSearchOptions options)
    : resolver_(resolver), layout_(std::move(layout)), options_(options) {
  options_.lookback_days = std::max(options_.lookback_days, 0);
  options_.worker_threads = std::max(options_.worker_threads, 1U);
}

std::optional<HistoricalLookupResult> HistoricalSearch::exact_phase(
    const core::WorkUnitId& unit, domain::FileCategory category, const core::Date& up_to,
    const std::optional<core::Date>& earliest, std::vector<std::string>& errors) const {
  // Only category folders that exist can hold a hit; collect them once.
  std::vector<core::Date> folder_days;
  for (int back = 0; back <= options_.lookback_days; ++back) {
    const core::Date day = core::add_days(up_to, -back);
    std::error_code ec;
    if (fs::is_directory(layout_.category_folder(day, category), ec)) {
      folder_days.push_back(day);
    } else if (ec && ec != std::errc::no_such_file_or_directory) {
      errors.push_back(layout_.category_folder(day, category).string() + ": " + ec.message());
    }
  }

  for (int back = 0; back <= options_.lookback_days; ++back) {
    const core::Date file_date = core::add_days(up_to, -back);
    if (earliest.has_value() && file_date < *earliest) {
      break;
    }
    const auto names = layout_.expected_filenames(unit, category, file_date);
    for (const auto& folder_day : folder_days) {
      for (const auto& name : names) {
        const fs::path candidate = layout_.category_folder(folder_day, category) / name;
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec)) {
          HistoricalLookupResult result;
          result.path = candidate;
          result.strategy = LookupStrategy::kExact;
          result.effective_date = file_date;
          result.folder_date = folder_day;
          result.score = 1.0;
          result.reason = "expected name " + name + " found in folder " +
                          core::format_compact(folder_day);
          return result;
        }
        if (ec && ec != std::errc::no_such_file_or_directory) {
          errors.push_back(candidate.string() + ": " + ec.message());
        }
      }
    }
  }
  return std::nullopt;
}

HistoricalSearch::ScanBatch HistoricalSearch::scan_folders(
    const std::vector<core::Date>& folder_days, const core::WorkUnitId& unit,
    domain::FileCategory category, const core::Date& latest,
    const std::optional<core::Date>& earliest) const {
  ScanBatch batch;

  for (const auto& day : folder_days) {
    const fs::path folder = layout_.day_folder(day);
    std::error_code ec;
    if (!fs::is_directory(folder, ec)) {
      if (ec && ec != std::errc::no_such_file_or_directory) {
        batch.errors.push_back(folder.string() + ": " + ec.message());
      }
      continue;
    }

    fs::recursive_directory_iterator it(folder, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
      batch.errors.push_back(folder.string() + ": " + ec.message());
      continue;
    }

    for (const fs::recursive_directory_iterator end{}; it != end; it.increment(ec)) {
      if (ec) {
        batch.errors.push_back(folder.string() + ": " + ec.message());
        break;
      }
      std::error_code entry_ec;
      if (!it->is_regular_file(entry_ec)) {
        continue;
      }

      const auto id = resolver_.identify(it->path().filename().string());
      if (!id.extension_accepted || id.unit != unit || id.category != category ||
          !id.file_date.has_value() || *id.file_date > latest ||
          (earliest.has_value() && *id.file_date < *earliest)) {
        continue;
      }

      const auto* outcome = id.aggregate.outcome(resolve::kIdentifierTarget);
      batch.candidates.push_back(Candidate{
          .path = it->path(),
          .filename = id.filename,
          .file_date = *id.file_date,
          .folder_date = day,
          .score = outcome != nullptr ? outcome->score : 0.0,
      });
    }
  }

  return batch;
}

HistoricalLookupResult HistoricalSearch::find_last_satisfying(
    const core::WorkUnitId& unit, domain::FileCategory category, const core::Date& up_to,
    std::optional<core::Date> latest_accepted, std::optional<core::Date> earliest_accepted) const {
  std::vector<std::string> errors;

  if (auto exact = exact_phase(unit, category, up_to, earliest_accepted, errors)) {
    exact->scan_errors = std::move(errors);
    return *exact;
  }

  std::vector<core::Date> folder_days;
  for (int back = 0; back <= options_.lookback_days; ++back) {
    folder_days.push_back(core::add_days(up_to, -back));
  }
  const core::Date latest = latest_accepted.value_or(up_to);

  // Fan out over contiguous slices of the window; results come back through
  // the futures only, so workers share nothing mutable.
  std::vector<ScanBatch> batches;
  const std::size_t workers =
      std::min<std::size_t>(options_.worker_threads, folder_days.size());
  if (workers <= 1) {
    batches.push_back(scan_folders(folder_days, unit, category, latest, earliest_accepted));
  } else {
    const std::size_t slice = (folder_days.size() + workers - 1) / workers;
    std::vector<std::future<ScanBatch>> futures;
    for (std::size_t begin = 0; begin < folder_days.size(); begin += slice) {
      const std::size_t end = std::min(begin + slice, folder_days.size());
      std::vector<core::Date> part(folder_days.begin() + static_cast<std::ptrdiff_t>(begin),
                                   folder_days.begin() + static_cast<std::ptrdiff_t>(end));
      futures.push_back(std::async(std::launch::async, [this, part = std::move(part), &unit,
                                                        category, latest, earliest_accepted]() {
        return scan_folders(part, unit, category, latest, earliest_accepted);
      }));
    }
    for (auto& f : futures) {
      batches.push_back(f.get());
    }
  }

  std::optional<Candidate> best;
  for (auto& batch : batches) {
    errors.insert(errors.end(), batch.errors.begin(), batch.errors.end());
    for (auto& candidate : batch.candidates) {
      const bool better =
          !best.has_value() ||
          std::tie(candidate.file_date, candidate.filename, candidate.path) >
              std::tie(best->file_date, best->filename, best->path);
      if (better) {
        best = std::move(candidate);
      }
    }
  }

  HistoricalLookupResult result;
  result.scan_errors = std::move(errors);
  if (!best.has_value()) {
    result.reason = "no exact or fuzzy match for " + unit.value + "/" +
                    std::string(domain::to_string(category)) + " within " +
                    std::to_string(options_.lookback_days) + " days up to " +
                    core::format_iso(up_to);
    if (earliest_accepted.has_value()) {
      result.reason += " dated from " + core::format_iso(*earliest_accepted);
    }
    return result;
  }

  result.path = best->path;
  result.strategy = LookupStrategy::kFuzzy;
  result.effective_date = best->file_date;
  result.folder_date = best->folder_date;
  result.score = best->score;
  result.reason = "fuzzy match " + best->filename + " dated " + core::format_iso(best->file_date) +
                  " in folder " + core::format_compact(best->folder_date);
  return result;
}

HistoricalLookupResult HistoricalSearch::find_for_period(const core::WorkUnitId& unit,
                                                         domain::FileCategory category,
                                                         const core::Date& period_date) const {
  const auto range = resolver_.config().date_ranges.range_for(category);
  const core::Date latest = range.has_value() ? range->last : period_date;
  std::optional<core::Date> earliest;
  if (range.has_value() && category == domain::FileCategory::kPlannedRoutes) {
    earliest = range->first;
  }
  return find_last_satisfying(unit, category, latest, latest, earliest);
}

}  // namespace dcm::history
