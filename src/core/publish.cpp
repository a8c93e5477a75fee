#include "core/publish.hpp"

#include "core/fs_utils.hpp"

#include <set>
#include <sstream>
#include <string_view>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace bootstream::core {

namespace {

using errors::Error;
using errors::ErrorKind;

constexpr std::string_view kJournalHeader = "bootstream-publish-journal 1";

fs::path StagedPathFor(const fs::path& target) {
  return fs::path(target.string() + kStagedSuffix);
}

void RemoveStagedBestEffort(const std::vector<fs::path>& staged_paths) {
  for (const auto& staged : staged_paths) {
    std::error_code ec;
    (void)fs::remove(staged, ec);
  }
}

// Leftovers of a staging phase that died before its journal was written were
// never published; they are safe to drop.
void DiscardStaleStagedFiles(const fs::path& directory) {
  std::error_code ec;
  if (!fs::is_directory(directory, ec)) {
    return;
  }
  for (const auto& entry : fs::directory_iterator(directory, ec)) {
    const std::string name = entry.path().filename().string();
    if (name.size() > std::string_view(kStagedSuffix).size() &&
        name.compare(name.size() - std::string_view(kStagedSuffix).size(),
                     std::string_view::npos, kStagedSuffix) == 0) {
      std::error_code remove_ec;
      (void)fs::remove(entry.path(), remove_ec);
    }
  }
}

bool StageAction(const PublishAction& action, std::vector<fs::path>& staged_paths, Error& error) {
  const fs::path staged = StagedPathFor(action.target);
  std::string io_error;
  if (!EnsureParentDirectory(staged, io_error)) {
    return error.Set(ErrorKind::kIoFailure, io_error);
  }

  if (!action.copy_from.empty()) {
    std::error_code ec;
    fs::copy_file(action.copy_from, staged, fs::copy_options::overwrite_existing, ec);
    if (ec) {
      return error.Set(ErrorKind::kIoFailure, "failed to stage copy of '" +
                                                  action.copy_from.string() + "' to '" +
                                                  staged.string() + "': " + ec.message());
    }
    staged_paths.push_back(staged);
    return true;
  }

  staged_paths.push_back(staged);
  if (!WriteFileBytes(staged, action.content, io_error)) {
    return error.Set(ErrorKind::kIoFailure, io_error);
  }
  return true;
}

std::string RenderJournal(const PublishBatch& batch) {
  std::ostringstream out;
  out << kJournalHeader << '\n';
  for (const auto& action : batch.Actions()) {
    if (action.type == PublishActionType::kReplace) {
      out << "replace\t" << action.target.string() << '\n';
    } else {
      out << "remove\t" << action.target.string() << '\n';
    }
  }
  return out.str();
}

bool CommitReplace(const fs::path& target, PublishResult& result, Error& error) {
  std::error_code ec;
  fs::rename(StagedPathFor(target), target, ec);
  if (ec) {
    return error.Set(ErrorKind::kIoFailure,
                     "failed to publish '" + target.string() + "': " + ec.message());
  }
  result.replaced.push_back(target);
  return true;
}

bool CommitRemove(const fs::path& target, PublishResult& result, Error& error) {
  std::error_code ec;
  const bool removed = fs::remove(target, ec);
  if (ec) {
    return error.Set(ErrorKind::kIoFailure,
                     "failed to remove '" + target.string() + "': " + ec.message());
  }
  if (removed) {
    result.removed.push_back(target);
  }
  return true;
}

bool RemoveJournal(const fs::path& journal_path, Error& error) {
  std::error_code ec;
  (void)fs::remove(journal_path, ec);
  if (ec) {
    return error.Set(ErrorKind::kIoFailure, "failed to remove publish journal '" +
                                                journal_path.string() + "': " + ec.message());
  }
  return true;
}

} // namespace

PublishBatch::PublishBatch(fs::path journal_path) : journal_path_(std::move(journal_path)) {}

void PublishBatch::StageContent(const fs::path& target, std::string content) {
  PublishAction action;
  action.type = PublishActionType::kReplace;
  action.target = target;
  action.content = std::move(content);
  actions_.push_back(std::move(action));
}

void PublishBatch::StageCopy(const fs::path& source, const fs::path& target) {
  PublishAction action;
  action.type = PublishActionType::kReplace;
  action.target = target;
  action.copy_from = source;
  actions_.push_back(std::move(action));
}

void PublishBatch::StageRemoval(const fs::path& target) {
  PublishAction action;
  action.type = PublishActionType::kRemove;
  action.target = target;
  actions_.push_back(std::move(action));
}

bool PublishBatch::Empty() const {
  return actions_.empty();
}

const std::vector<PublishAction>& PublishBatch::Actions() const {
  return actions_;
}

const fs::path& PublishBatch::JournalPath() const {
  return journal_path_;
}

bool HasPendingJournal(const fs::path& journal_path) {
  std::error_code ec;
  return fs::exists(journal_path, ec) && !ec;
}

bool Publish(const PublishBatch& batch, const PublishHooks& hooks, PublishResult& result,
             Error& error) {
  result = PublishResult{};
  if (batch.Empty()) {
    return true;
  }
  if (HasPendingJournal(batch.JournalPath())) {
    return error.Set(ErrorKind::kPartialWriteDetected,
                     "an interrupted publish is pending at '" + batch.JournalPath().string() +
                         "'; run recover before mutating the tree");
  }

  std::set<fs::path> staging_directories = {batch.JournalPath().parent_path()};
  for (const auto& action : batch.Actions()) {
    if (action.type == PublishActionType::kReplace) {
      staging_directories.insert(action.target.parent_path());
    }
  }
  for (const auto& directory : staging_directories) {
    DiscardStaleStagedFiles(directory);
  }

  std::vector<fs::path> staged_paths;
  for (const auto& action : batch.Actions()) {
    if (action.type != PublishActionType::kReplace) {
      continue;
    }
    if (!StageAction(action, staged_paths, error)) {
      RemoveStagedBestEffort(staged_paths);
      return false;
    }
  }

  std::string io_error;
  if (!WriteTextFileAtomic(batch.JournalPath(), RenderJournal(batch), io_error)) {
    RemoveStagedBestEffort(staged_paths);
    return error.Set(ErrorKind::kIoFailure, io_error);
  }

  for (const auto& action : batch.Actions()) {
    if (hooks.before_commit_step && !hooks.before_commit_step(action.target)) {
      return error.Set(ErrorKind::kPartialWriteDetected,
                       "publish interrupted before '" + action.target.string() + "'");
    }
    const bool ok = action.type == PublishActionType::kReplace
                        ? CommitReplace(action.target, result, error)
                        : CommitRemove(action.target, result, error);
    if (!ok) {
      return false;
    }
  }

  return RemoveJournal(batch.JournalPath(), error);
}

bool RecoverPublish(const fs::path& journal_path, PublishResult& result, Error& error) {
  result = PublishResult{};

  std::string text;
  std::string io_error;
  if (!ReadFileBytes(journal_path, text, io_error)) {
    return error.Set(ErrorKind::kIoFailure, io_error);
  }

  std::istringstream lines(text);
  std::string line;
  if (!std::getline(lines, line) || line != kJournalHeader) {
    return error.Set(ErrorKind::kPartialWriteDetected,
                     "unrecognized publish journal '" + journal_path.string() + "'");
  }

  while (std::getline(lines, line)) {
    if (line.empty()) {
      continue;
    }
    const std::size_t tab = line.find('\t');
    if (tab == std::string::npos) {
      return error.Set(ErrorKind::kPartialWriteDetected,
                       "malformed publish journal line: " + line);
    }
    const std::string verb = line.substr(0, tab);
    const fs::path target = line.substr(tab + 1);

    if (verb == "remove") {
      if (!CommitRemove(target, result, error)) {
        return false;
      }
      continue;
    }
    if (verb != "replace") {
      return error.Set(ErrorKind::kPartialWriteDetected,
                       "unknown publish journal action: " + verb);
    }

    std::error_code ec;
    if (fs::exists(StagedPathFor(target), ec)) {
      if (!CommitReplace(target, result, error)) {
        return false;
      }
      continue;
    }
    // Already renamed before the interruption.
    if (!fs::exists(target, ec)) {
      return error.Set(ErrorKind::kPartialWriteDetected,
                       "journal entry has neither staged nor published file: " +
                           target.string());
    }
  }

  return RemoveJournal(journal_path, error);
}

} // namespace bootstream::core
