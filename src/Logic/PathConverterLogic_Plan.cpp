#include "PathConverterLogic.h"

#include <wx/config.h>

#include <filesystem>
#include <string>
#include <vector>
#include <optional>
#include <system_error> // For std::error_code

namespace fs = std::filesystem;

// Reads the user's stored defaults; missing keys fall back to the built-in defaults
StoredDefaults PathConverterLogic::loadDefaults(const wxConfigBase *cfg)
{
	StoredDefaults defaults;
	if (!cfg)
		return defaults; // No config system available, use built-in defaults

	defaults.noClobber = cfg->ReadBool("/Defaults/NoClobber", false);
	defaults.verbose = cfg->ReadBool("/Defaults/Verbose", false);
	defaults.fromConvention = cfg->Read("/Defaults/FromConvention", wxEmptyString).ToStdString();
	defaults.historyEnabled = cfg->ReadBool("/History/Enabled", false);
	return defaults;
}

// Checks everything that must abort the invocation before the first rename
// All problems are collected so the user sees them at once
ValidatedInput PathConverterLogic::validateInput(const InputParams &params)
{
	ValidatedInput validated;

	ConventionParseResult to = ParseConvention(params.toConvention);
	if (to.success)
	{
		validated.request.to = to.convention;
	}
	else
	{
		validated.errorLog.push_back(to.errorMessage);
		validated.exitCode = 1;
	}

	if (params.fromConvention)
	{
		ConventionParseResult from = ParseConvention(*params.fromConvention);
		if (from.success)
		{
			validated.request.from = from.convention;
		}
		else
		{
			validated.errorLog.push_back(from.errorMessage);
			validated.exitCode = 1;
		}
	}

	if (params.paths.empty())
	{
		validated.errorLog.push_back("No paths to convert were given");
		validated.exitCode = 1;
	}

	for (const auto &path : params.paths)
	{
		// A dangling symbolic link is still something that can be renamed
		std::error_code ec;
		if (!fs::exists(fs::symlink_status(path, ec)) || ec)
		{
			validated.errorLog.push_back("no such file or directory '" + path.string() + "'");
			if (validated.exitCode == 0)
			{
				validated.exitCode = 2;
			}
		}
	}

	validated.success = validated.errorLog.empty();
	return validated;
}

// Runs the conversion over every input path, reporting each outcome as soon as it is known
// A failing path never stops the remaining ones
RenameExecutionResult PathConverterLogic::performConversion(const InputParams &params, const ValidatedInput &validated,
															const OutcomeReporter &reporter)
{
	RenameExecutionResult results;
	if (!validated.success)
	{
		return results;
	}

	std::optional<fs::path> prefix;
	if (params.prefix)
	{
		prefix = fs::path(*params.prefix);
	}

	bool anyFailure = false;
	for (const auto &path : params.paths)
	{
		std::error_code typeEc;
		const bool isDirectory = fs::is_directory(fs::symlink_status(path, typeEc)) && !typeEc;

		if (params.recursive && isDirectory)
		{
			RenameExecutionResult subtree = applyRecursive(path, validated.request, params.noClobber, params.dryRun, reporter);
			results.outcomes.insert(results.outcomes.end(), subtree.outcomes.begin(), subtree.outcomes.end());
			results.warningLog.insert(results.warningLog.end(), subtree.warningLog.begin(), subtree.warningLog.end());
			if (!subtree.overallSuccess)
			{
				anyFailure = true;
			}
			continue;
		}

		RenameOutcome outcome = applyOne(path, validated.request, params.mode, prefix, params.noClobber, params.dryRun);
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
