#pragma once

#include "core/errors/error.hpp"

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace bootstream::core {

// Suffix of fully written files waiting to be renamed into place.
inline constexpr const char* kStagedSuffix = ".staged";

enum class PublishActionType {
  kReplace,
  kRemove,
};

struct PublishAction {
  PublishActionType type = PublishActionType::kReplace;
  std::filesystem::path target;
  // kReplace only: either in-memory content or a source file to duplicate.
  std::string content;
  std::filesystem::path copy_from;
};

// Ordered set of file changes published as one unit. Actions are committed in
// the order they were added, so callers stage artifacts first, product files
// next and the index last.
class PublishBatch {
public:
  explicit PublishBatch(std::filesystem::path journal_path);

  void StageContent(const std::filesystem::path& target, std::string content);
  void StageCopy(const std::filesystem::path& source, const std::filesystem::path& target);
  void StageRemoval(const std::filesystem::path& target);

  bool Empty() const;
  const std::vector<PublishAction>& Actions() const;
  const std::filesystem::path& JournalPath() const;

private:
  std::filesystem::path journal_path_;
  std::vector<PublishAction> actions_;
};

// Test seam: invoked before every rename/removal. Returning false stops the
// publish at that point exactly as a crash would, leaving the journal behind.
struct PublishHooks {
  std::function<bool(const std::filesystem::path& target)> before_commit_step;
};

struct PublishResult {
  std::vector<std::filesystem::path> replaced;
  std::vector<std::filesystem::path> removed;
};

// Staged publish protocol:
// 1) every kReplace action is written in full to `<target>.staged`
// 2) the journal listing all actions is written atomically
// 3) staged files are renamed over their targets, removals are applied
// 4) the journal is deleted
//
// A failure in 1) or 2) removes the staged files and leaves every target
// untouched. Once the journal exists the batch can always be rolled forward by
// RecoverPublish().
bool Publish(const PublishBatch& batch, const PublishHooks& hooks, PublishResult& result,
             errors::Error& error);

bool HasPendingJournal(const std::filesystem::path& journal_path);

// Rolls an interrupted publish forward and deletes its journal.
bool RecoverPublish(const std::filesystem::path& journal_path, PublishResult& result,
                    errors::Error& error);

} // namespace bootstream::core
