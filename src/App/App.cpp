#include "App.h"

#include <wx/config.h>
#include <wx/log.h>
#include <wx/crt.h>

#include <clocale>

wxIMPLEMENT_APP_CONSOLE(App);

bool App::OnInit()
{
	SetAppName("ccpath");

	// Case mapping of non-ASCII names follows the user's locale
	wxSetlocale(LC_CTYPE, "");

	// Stored defaults have to be known before the command line is parsed, switches can only add to them
	wxConfigBase::Set(new wxConfig(GetAppName()));
	m_defaults = PathConverterLogic::loadDefaults(wxConfigBase::Get(false));

	// Console output must be stable enough to script against
	wxLog::DisableTimestamp();

	if (!wxAppConsole::OnInit())
	{
		delete wxConfigBase::Set(nullptr);
		return false;
	}
	return true;
}

int App::OnRun()
{
	wxLog::SetVerbose(m_params.verbose);

	// Nothing is renamed unless every convention and every input path is valid
	ValidatedInput validated = PathConverterLogic::validateInput(m_params);
	if (!validated.success)
	{
		for (const auto &msg : validated.errorLog)
		{
			wxLogError("%s", wxString::FromUTF8(msg.c_str()));
		}
		return validated.exitCode;
	}

	wxLogVerbose("Converting %d path(s) into '%s'", (int)m_params.paths.size(),
				 PathConverterLogic::ConventionToken(validated.request.to).c_str());

	RenameExecutionResult result = PathConverterLogic::performConversion(
		m_params, validated,
		[this](const RenameOutcome &outcome)
		{ ReportOutcome(outcome); });

	ReportWarnings(result.warningLog);

	if (m_defaults.historyEnabled && !m_params.dryRun)
	{
		const fs::path logPath = PathConverterLogic::getHistoryLogPath();
		if (!PathConverterLogic::writeHistoryLog(logPath, result.outcomes, validated.request))
		{
			wxLogWarning("Could not write rename history to '%s'", logPath.string().c_str());
		}
	}

	return result.overallSuccess ? 0 : 3;
}

int App::OnExit()
{
	// Flush and release the config object created in OnInit
	delete wxConfigBase::Set(nullptr);
	return wxAppConsole::OnExit();
}
