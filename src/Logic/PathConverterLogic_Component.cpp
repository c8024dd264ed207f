#include "PathConverterLogic.h"

#include <wx/strconv.h>
#include <wx/string.h>

#include <string>
#include <vector>

// Checks that 'text' is well-formed UTF-8 before any case conversion is attempted
bool PathConverterLogic::IsValidUtf8(const std::string &text)
{
	if (text.empty())
	{
		return true;
	}
	return wxConvUTF8.ToWChar(nullptr, 0, text.data(), text.size()) != wxCONV_FAILED;
}

// Splits a segment at its last dot
// A leading dot does not start an extension unless it is the only dot (".gitignore" is extension-only)
PathComponent PathConverterLogic::DecomposeComponent(const std::string &component)
{
	PathComponent result;
	if (component.empty() || component == "." || component == "..")
	{
		return result;
	}

	const std::size_t lastDot = component.find_last_of('.');
	if (lastDot == std::string::npos)
	{
		result.stem = component;
	}
	else if (lastDot == 0)
	{
		result.extension = component.substr(1);
	}
	else
	{
		result.stem = component.substr(0, lastDot);
		result.extension = component.substr(lastDot + 1);
	}
	return result;
}

// Converts one path segment into the requested convention, keeping its extension verbatim
ComponentResult PathConverterLogic::ConvertComponent(const std::string &component, const ConversionRequest &request)
{
	ComponentResult result;

	// Everything below may assume the segment decodes cleanly
	if (!IsValidUtf8(component))
	{
		result.error = PathConvertError::InvalidUtf8Path;
		return result;
	}

	const PathComponent parts = DecomposeComponent(component);
	if (!parts.stem && !parts.extension)
	{
		result.error = PathConvertError::InvalidPath;
		return result;
	}

	if (!parts.stem)
	{
		// Nothing renamable besides the extension itself
		result.value = component;
		result.success = true;
		return result;
	}

	const wxString stem = wxString::FromUTF8(parts.stem->c_str(), parts.stem->size());
	const std::vector<wxString> words = request.from ? SplitWords(stem, *request.from) : SplitWords(stem);
	wxString converted = ConvertCase(words, request.to);
	if (converted.empty())
	{
		// A stem made only of separators has no words to join
		converted = stem;
	}

	result.value = std::string(converted.utf8_str().data());
	if (parts.extension)
	{
		result.value += "." + *parts.extension;
	}
	result.success = true;
	return result;
}
