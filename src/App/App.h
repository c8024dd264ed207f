#ifndef APP_H
#define APP_H

#include <wx/app.h>
#include <wx/cmdline.h>

#include "PathConverterLogic.h"

// Console front end: parses the command line, merges stored defaults and drives PathConverterLogic
class App : public wxAppConsole
{
public:
	virtual bool OnInit() override;
	virtual int OnRun() override;
	virtual int OnExit() override;

	virtual void OnInitCmdLine(wxCmdLineParser &parser) override;
	virtual bool OnCmdLineParsed(wxCmdLineParser &parser) override;

private:
	void ReportOutcome(const RenameOutcome &outcome) const;
	void ReportWarnings(const std::vector<std::string> &warnings) const;

	InputParams m_params;
	StoredDefaults m_defaults;
};

#endif // APP_H
