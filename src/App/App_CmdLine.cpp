#include "App.h"

#include <wx/cmdline.h>
#include <wx/log.h>

#include <string>

namespace
{
const wxCmdLineEntryDesc cmdLineDesc[] = {
	{wxCMD_LINE_SWITCH, "h", "help", "show this help message", wxCMD_LINE_VAL_NONE, wxCMD_LINE_OPTION_HELP},
	{wxCMD_LINE_SWITCH, "r", "recursive", "recurse into a directory"},
	{wxCMD_LINE_SWITCH, NULL, "dry-run", "show the operations that would be performed without doing them"},
	{wxCMD_LINE_SWITCH, "v", "verbose", "print a message for every converted path"},
	{wxCMD_LINE_SWITCH, "n", "no-clobber", "do not overwrite an existing destination"},
	{wxCMD_LINE_SWITCH, "b", "basename", "only convert the basename of each given path (default)"},
	{wxCMD_LINE_SWITCH, "F", "full-path", "convert all components of the path"},
	{wxCMD_LINE_OPTION, "P", "prefix", "exclude a path prefix when '--full-path' is given, otherwise ignored", wxCMD_LINE_VAL_STRING},
	{wxCMD_LINE_OPTION, "f", "from", "the current naming convention, if known; improves conversion accuracy", wxCMD_LINE_VAL_STRING},
	{wxCMD_LINE_PARAM, NULL, NULL, "convention", wxCMD_LINE_VAL_STRING, wxCMD_LINE_OPTION_MANDATORY},
	{wxCMD_LINE_PARAM, NULL, NULL, "paths", wxCMD_LINE_VAL_STRING, wxCMD_LINE_OPTION_MANDATORY | wxCMD_LINE_PARAM_MULTIPLE},
	{wxCMD_LINE_NONE}};

std::string ToUtf8(const wxString &value)
{
	return std::string(value.utf8_str().data());
}
} // namespace

void App::OnInitCmdLine(wxCmdLineParser &parser)
{
	parser.SetDesc(cmdLineDesc);
	parser.SetSwitchChars("-");

	wxString conventions = "ccpath supports several naming conventions:\n";
	for (const auto &info : PathConverterLogic::Conventions())
	{
		conventions += wxString::Format("  %-6s %s\n", info.token, info.example);
	}
	parser.AddUsageText(conventions);
}

// Copies the parsed command line into m_params; validation of the values happens in OnRun
bool App::OnCmdLineParsed(wxCmdLineParser &parser)
{
	const bool basename = parser.Found("b");
	const bool fullPath = parser.Found("F");
	if (basename && fullPath)
	{
		wxLogError("'--basename' and '--full-path' cannot be used together");
		parser.Usage();
		return false;
	}

	m_params.recursive = parser.Found("r");
	m_params.dryRun = parser.Found("dry-run");
	m_params.verbose = parser.Found("v") || m_defaults.verbose;
	m_params.noClobber = parser.Found("n") || m_defaults.noClobber;
	m_params.mode = fullPath ? PathMode::FullPath : PathMode::Basename;

	wxString value;
	if (parser.Found("P", &value))
	{
		if (fullPath)
		{
			m_params.prefix = ToUtf8(value);
		}
		else
		{
			wxLogWarning("'--prefix' is ignored without '--full-path'");
		}
	}

	if (parser.Found("f", &value))
	{
		m_params.fromConvention = ToUtf8(value);
	}
	else if (!m_defaults.fromConvention.empty())
	{
		m_params.fromConvention = m_defaults.fromConvention;
	}

	m_params.toConvention = ToUtf8(parser.GetParam(0));
	for (size_t i = 1; i < parser.GetParamCount(); ++i)
	{
		m_params.paths.push_back(fs::u8path(ToUtf8(parser.GetParam(i))));
	}
	return true;
}
