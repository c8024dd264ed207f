#include "App.h"

#include <wx/crt.h>
#include <wx/log.h>

// Mapping lines are program output and go to stdout; problems go through wxLog to stderr
void App::ReportOutcome(const RenameOutcome &outcome) const
{
	const wxString mapping = wxString::FromUTF8(PathConverterLogic::FormatMapping(outcome.op).c_str());
	const wxString message = wxString::FromUTF8(outcome.message.c_str());

	switch (outcome.status)
	{
	case RenameStatus::Renamed:
	case RenameStatus::Unchanged:
	case RenameStatus::DryRun:
		if (PathConverterLogic::ShouldPrintMapping(outcome.status, m_params.verbose, m_params.dryRun))
		{
			wxPrintf("%s\n", mapping);
		}
		break;
	case RenameStatus::SkippedDestinationExists:
		wxLogWarning("skipped '%s': %s", wxString::FromUTF8(outcome.op.OldFullPath.string().c_str()), message);
		break;
	case RenameStatus::ConversionFailed:
	case RenameStatus::RenameFailed:
		wxLogError("%s", message);
		break;
	}
}

void App::ReportWarnings(const std::vector<std::string> &warnings) const
{
	for (const auto &msg : warnings)
	{
		wxLogWarning("%s", wxString::FromUTF8(msg.c_str()));
	}
}
