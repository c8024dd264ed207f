#include "PathConverterLogic.h"

#include <wx/datetime.h>
#include <wx/stdpaths.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

std::string PathConverterLogic::DescribeError(PathConvertError error, const fs::path &path)
{
	switch (error)
	{
	case PathConvertError::InvalidUtf8Path:
		return "path contains invalid utf-8 characters: " + path.string();
	case PathConvertError::InvalidPath:
		return "paths must contain either a stem or an extension or both: '" + path.string() + "'";
	case PathConvertError::None:
		break;
	}
	return std::string();
}

std::string PathConverterLogic::FormatMapping(const RenameOperation &op)
{
	return "'" + op.OldFullPath.string() + "' -> '" + op.NewFullPath.string() + "'";
}

// Skips and unchanged paths are expected outcomes, not failures
bool PathConverterLogic::IsFailure(RenameStatus status)
{
	return status == RenameStatus::ConversionFailed || status == RenameStatus::RenameFailed;
}

// Dry runs list every processed path, changed or not; real runs only under --verbose
bool PathConverterLogic::ShouldPrintMapping(RenameStatus status, bool verbose, bool dryRun)
{
	switch (status)
	{
	case RenameStatus::DryRun:
		return true;
	case RenameStatus::Unchanged:
		return verbose || dryRun;
	case RenameStatus::Renamed:
		return verbose;
	default:
		return false;
	}
}

// Gets the path to the history log file in user's app data directory
fs::path PathConverterLogic::getHistoryLogPath()
{
	wxString stdPath = wxStandardPaths::Get().GetUserDataDir();
	fs::path logDir = fs::path(stdPath.ToStdWstring());
	return logDir / "rename_history.log";
}

// Appends one entry per run to the history log: a header naming the conversion, then every rename that took place
// Runs that renamed nothing leave the log untouched
bool PathConverterLogic::writeHistoryLog(const fs::path &logPath, const std::vector<RenameOutcome> &outcomes,
										 const ConversionRequest &request)
{
	std::vector<std::string> lines;
	for (const auto &outcome : outcomes)
	{
		if (outcome.status == RenameStatus::Renamed)
		{
			lines.push_back(FormatMapping(outcome.op));
		}
	}
	if (lines.empty())
		return true;

	std::error_code ec;
	if (logPath.has_parent_path() && !fs::exists(logPath.parent_path(), ec))
	{
		fs::create_directories(logPath.parent_path(), ec);
		if (ec)
			return false;
	}

	std::ofstream logFile(logPath, std::ios::app);
	if (!logFile.is_open())
		return false;

	const std::string from = request.from ? ConventionToken(*request.from) : std::string("auto");
	const wxString when = wxDateTime::Now().Format("%Y-%m-%d %H:%M:%S");

	logFile << "[" << when.ToStdString() << "] " << from << " -> " << ConventionToken(request.to)
			<< ", " << lines.size() << " renamed\n";
	for (const auto &line : lines)
	{
		logFile << "  " << line << "\n";
	}

	logFile.close();
	return !logFile.fail();
}
