#include "PathConverterLogic.h"

#include <wx/log.h>

#include <vector>
#include <string>
#include <filesystem>
#include <algorithm>	// For std::sort
#include <system_error> // For std::error_code
#include <stdexcept>	// For std::exception safety

namespace fs = std::filesystem;

namespace // Anonymous namespace for internal linkage helper functions
{
// "dir/" and "dir" name the same entry
fs::path WithoutTrailingSeparator(const fs::path &path)
{
	if (!path.has_filename() && path.has_relative_path())
	{
		return path.parent_path();
	}
	return path;
}
} // namespace

// Computes the destination of a single path and renames it
// Failures are recorded in the returned outcome; they never stop the caller from processing other paths
RenameOutcome PathConverterLogic::applyOne(const fs::path &path, const ConversionRequest &request, PathMode mode,
										   const std::optional<fs::path> &prefix, bool noClobber, bool dryRun)
{
	RenameOutcome outcome;
	outcome.op.OldFullPath = path;
	outcome.op.NewFullPath = path;

	PathResult destination;
	if (mode == PathMode::FullPath)
	{
		destination = prefix ? ConvertFullExceptPrefix(path, *prefix, request) : ConvertFull(path, request);
	}
	else
	{
		destination = ConvertBasename(path, request);
	}

	if (!destination.success)
	{
		outcome.status = RenameStatus::ConversionFailed;
		outcome.message = DescribeError(destination.error, path);
		return outcome;
	}
	outcome.op.NewFullPath = destination.value;

	if (WithoutTrailingSeparator(destination.value) == WithoutTrailingSeparator(path))
	{
		outcome.status = RenameStatus::Unchanged;
		return outcome;
	}

	if (dryRun)
	{
		outcome.status = RenameStatus::DryRun;
		return outcome;
	}

	const fs::path &target = outcome.op.NewFullPath;
	try
	{
		std::error_code targetExistEc, equivalentEc, parentEc, createEc, renameEc;

		// symlink_status so that a dangling link at the destination still counts as occupied
		// A missing destination also reports an error code, which is not a failure
		const fs::file_status targetStatus = fs::symlink_status(target, targetExistEc);
		bool targetExists = fs::exists(targetStatus);
		if (targetExistEc && targetStatus.type() != fs::file_type::not_found)
		{
			outcome.status = RenameStatus::RenameFailed;
			outcome.message = "Filesystem error checking destination '" + target.string() + "': " + targetExistEc.message();
			return outcome;
		}

		// On a case-insensitive filesystem "File" and "file" are the same entry, so a case-only rename is not a collision
		if (targetExists && fs::equivalent(path, target, equivalentEc) && !equivalentEc)
		{
			targetExists = false;
		}

		if (targetExists && noClobber)
		{
			outcome.status = RenameStatus::SkippedDestinationExists;
			outcome.message = "'" + target.string() + "' already exists";
			return outcome;
		}

		const fs::path parent = target.parent_path();
		if (!parent.empty() && !fs::is_directory(parent, parentEc))
		{
			fs::create_directories(parent, createEc);
			if (createEc)
			{
				outcome.status = RenameStatus::RenameFailed;
				outcome.message = "Failed to create directory '" + parent.string() + "': " + createEc.message();
				return outcome;
			}
			wxLogVerbose("Created directory '%s'", parent.string().c_str());
		}

		// Replaces an existing destination when clobbering is allowed
		fs::rename(path, target, renameEc);
		if (renameEc)
		{
			outcome.status = RenameStatus::RenameFailed;
			outcome.message = "Rename of '" + path.string() + "' failed: " + renameEc.message();
			return outcome;
		}
		outcome.status = RenameStatus::Renamed;
	}
	catch (const fs::filesystem_error &ex)
	{
		std::string errMsg = "Filesystem Exception: " + std::string(ex.what());
		if (!ex.path1().empty())
			errMsg += " (Path1: " + ex.path1().string() + ")";
		if (!ex.path2().empty())
			errMsg += " (Path2: " + ex.path2().string() + ")";
		outcome.status = RenameStatus::RenameFailed;
		outcome.message = errMsg;
	}
	catch (const std::exception &ex)
	{
		outcome.status = RenameStatus::RenameFailed;
		outcome.message = "General Exception: " + std::string(ex.what());
	}
	return outcome;
}

// Appends every entry below 'path' and then 'path' itself, so contents always precede their directory
void PathConverterLogic::CollectBottomUpInternal(const fs::path &path, std::vector<fs::path> &entries, std::vector<std::string> &warnings)
{
	std::error_code statusEc;
	const fs::file_status status = fs::symlink_status(path, statusEc); // Links are leaves, never followed

	if (!statusEc && fs::is_directory(status))
	{
		std::vector<fs::path> children;
		std::error_code iterEc;
		fs::directory_iterator it(path, iterEc);
		if (iterEc)
		{
			warnings.push_back("Cannot read directory '" + path.string() + "': " + iterEc.message());
		}
		else
		{
			for (; it != fs::directory_iterator(); it.increment(iterEc))
			{
				children.push_back(it->path());
			}
			if (iterEc)
			{
				warnings.push_back("Error while reading directory '" + path.string() + "': " + iterEc.message());
			}
		}

		// Sorted so that runs over the same tree are reproducible
		std::sort(children.begin(), children.end());
		for (const auto &child : children)
		{
			CollectBottomUpInternal(child, entries, warnings);
		}
	}
	else if (statusEc)
	{
		warnings.push_back("Cannot stat '" + path.string() + "': " + statusEc.message());
	}

	entries.push_back(path);
}

// Lists the subtree rooted at 'directory' (the root included) in post-order
std::vector<fs::path> PathConverterLogic::collectBottomUp(const fs::path &directory, std::vector<std::string> *warnings)
{
	std::vector<fs::path> entries;
	std::vector<std::string> localWarnings;
	CollectBottomUpInternal(directory, entries, warnings ? *warnings : localWarnings);
	return entries;
}

// Renames a whole subtree, contents first
// Every entry is addressed through its original parent, which is still valid because parents are renamed after their contents
RenameExecutionResult PathConverterLogic::applyRecursive(const fs::path &directory, const ConversionRequest &request,
														 bool noClobber, bool dryRun, const OutcomeReporter &reporter)
{
	RenameExecutionResult results;
	const std::vector<fs::path> entries = collectBottomUp(directory, &results.warningLog);

	bool anyFailure = false;
	for (const auto &entry : entries)
	{
		RenameOutcome outcome = applyOne(entry, request, PathMode::Basename, std::nullopt, noClobber, dryRun);
		if (IsFailure(outcome.status))
		{
			anyFailure = true;
		}
		if (reporter)
		{
			reporter(outcome);
		}
		results.outcomes.push_back(outcome);
	}

	results.overallSuccess = !anyFailure;
	return results;
}
