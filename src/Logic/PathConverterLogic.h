#ifndef PATHCONVERTERLOGIC_H
#define PATHCONVERTERLOGIC_H

#include <vector>
#include <string>
#include <filesystem>
#include <functional>
#include <optional>

#include <wx/string.h>

class wxConfigBase;

namespace fs = std::filesystem;

// The supported file naming conventions
// Converting into some of these (flat case in particular) loses word boundaries,
// so a converted name cannot always be converted back without knowing its source convention
enum class Convention
{
	TitleCase,		// Some File
	FlatCase,		// somefile
	UpperFlatCase,	// SOMEFILE
	CamelCase,		// someFile
	UpperCamelCase, // SomeFile
	SnakeCase,		// some_file
	UpperSnakeCase, // SOME_FILE
	KebabCase		// some-file
};

enum class PathMode
{
	Basename,
	FullPath
};

enum class PathConvertError
{
	None,
	InvalidUtf8Path,
	InvalidPath
};

enum class RenameStatus
{
	Renamed,
	DryRun,
	Unchanged,
	SkippedDestinationExists,
	ConversionFailed,
	RenameFailed
};

struct ConventionInfo
{
	Convention convention;
	const char *token;
	const char *example;
};

struct ConventionParseResult
{
	Convention convention = Convention::SnakeCase;
	bool success = false;
	std::string errorMessage;
};

struct ConversionRequest
{
	std::optional<Convention> from;
	Convention to = Convention::SnakeCase;
};

// A single path segment split at its last dot
// Dot-files (".gitignore") have an extension but no stem
struct PathComponent
{
	std::optional<std::string> stem;
	std::optional<std::string> extension;
};

struct ComponentResult
{
	std::string value;
	PathConvertError error = PathConvertError::None;
	bool success = false;
};

struct PathResult
{
	fs::path value;
	PathConvertError error = PathConvertError::None;
	bool success = false;
};

struct RenameOperation
{
	fs::path OldFullPath;
	fs::path NewFullPath;
};

struct RenameOutcome
{
	RenameOperation op;
	RenameStatus status = RenameStatus::Unchanged;
	std::string message;
};

struct RenameExecutionResult
{
	std::vector<RenameOutcome> outcomes;
	std::vector<std::string> warningLog;
	bool overallSuccess = false;
};

struct InputParams
{
	bool recursive = false;
	bool dryRun = false;
	bool verbose = false;
	bool noClobber = false;
	PathMode mode = PathMode::Basename;
	std::optional<std::string> prefix;
	std::optional<std::string> fromConvention;
	std::string toConvention;
	std::vector<fs::path> paths;
};

struct ValidatedInput
{
	ConversionRequest request;
	std::vector<std::string> errorLog;
	int exitCode = 0;
	bool success = false;
};

struct StoredDefaults
{
	bool noClobber = false;
	bool verbose = false;
	std::string fromConvention;
	bool historyEnabled = false;
};

using OutcomeReporter = std::function<void(const RenameOutcome &)>;

class PathConverterLogic
{
private:
	static void CollectBottomUpInternal(const fs::path &directory, std::vector<fs::path> &entries, std::vector<std::string> &warnings);

public:
	// Conventions
	static const std::vector<ConventionInfo> &Conventions();
	static ConventionParseResult ParseConvention(const std::string &token);
	static std::string ConventionToken(Convention convention);

	// Case conversion primitive
	static std::vector<wxString> SplitWords(const wxString &text);
	static std::vector<wxString> SplitWords(const wxString &text, Convention from);
	static wxString ConvertCase(const std::vector<wxString> &words, Convention to);

	// Components and paths
	static bool IsValidUtf8(const std::string &text);
	static PathComponent DecomposeComponent(const std::string &component);
	static ComponentResult ConvertComponent(const std::string &component, const ConversionRequest &request);
	static PathResult ConvertBasename(const fs::path &path, const ConversionRequest &request);
	static PathResult ConvertFull(const fs::path &path, const ConversionRequest &request);
	static PathResult ConvertFullExceptPrefix(const fs::path &path, const fs::path &prefix, const ConversionRequest &request);
	static bool StartsWithComponents(const fs::path &path, const fs::path &prefix);

	// Renaming
	static RenameOutcome applyOne(const fs::path &path, const ConversionRequest &request, PathMode mode,
								  const std::optional<fs::path> &prefix, bool noClobber, bool dryRun);
	static std::vector<fs::path> collectBottomUp(const fs::path &directory, std::vector<std::string> *warnings = nullptr);
	static RenameExecutionResult applyRecursive(const fs::path &directory, const ConversionRequest &request,
												bool noClobber, bool dryRun, const OutcomeReporter &reporter = nullptr);

	// Invocation
	static StoredDefaults loadDefaults(const wxConfigBase *cfg);
	static ValidatedInput validateInput(const InputParams &params);
	static RenameExecutionResult performConversion(const InputParams &params, const ValidatedInput &validated,
												   const OutcomeReporter &reporter = nullptr);

	// Reporting and history
	static std::string DescribeError(PathConvertError error, const fs::path &path);
	static std::string FormatMapping(const RenameOperation &op);
	static bool IsFailure(RenameStatus status);
	static bool ShouldPrintMapping(RenameStatus status, bool verbose, bool dryRun);
	static bool writeHistoryLog(const fs::path &logPath, const std::vector<RenameOutcome> &outcomes, const ConversionRequest &request);
	static fs::path getHistoryLogPath();
};

#endif // PATHCONVERTERLOGIC_H
