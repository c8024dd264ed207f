#include "PathConverterLogic.h"

#include <wx/string.h>
#include <wx/wxcrt.h>

#include <string>
#include <vector>

namespace // Anonymous namespace for internal linkage helper functions
{
// Which word boundaries a splitter honours
struct BoundaryRules
{
	bool whitespace;
	bool underscore;
	bool hyphen;
	bool caseAndDigits; // lower->Upper, ACRONYMWord, letter<->digit
};

inline bool IsUpperChar(wchar_t c) { return wxIsupper(c) != 0; }
inline bool IsLowerChar(wchar_t c) { return wxIslower(c) != 0; }
inline bool IsDigitChar(wchar_t c) { return wxIsdigit(c) != 0; }
inline bool IsCasedChar(wchar_t c) { return IsUpperChar(c) || IsLowerChar(c); }

bool IsSeparator(wchar_t c, const BoundaryRules &rules)
{
	if (rules.whitespace && wxIsspace(c))
		return true;
	if (rules.underscore && c == L'_')
		return true;
	if (rules.hyphen && c == L'-')
		return true;
	return false;
}

// True when a new word starts at 'text[i]', given the word collected so far ends in 'prev'
bool StartsNewWord(const std::wstring &text, size_t i, wchar_t prev)
{
	const wchar_t c = text[i];
	const wchar_t next = (i + 1 < text.size()) ? text[i + 1] : L'\0';

	if (IsLowerChar(prev) && IsUpperChar(c))
		return true; // someFile -> some|File
	if (IsUpperChar(prev) && IsUpperChar(c) && next != L'\0' && IsLowerChar(next))
		return true; // HTMLFile -> HTML|File
	if (IsDigitChar(prev) && IsCasedChar(c))
		return true; // 2nd -> 2|nd
	if (IsCasedChar(prev) && IsDigitChar(c))
		return true; // file2 -> file|2
	return false;
}

std::vector<wxString> SplitByRules(const wxString &input, const BoundaryRules &rules)
{
	std::vector<wxString> words;
	const std::wstring text = input.ToStdWstring();
	std::wstring current;

	auto flush = [&]()
	{
		if (!current.empty())
		{
			words.push_back(wxString(current));
			current.clear();
		}
	};

	for (size_t i = 0; i < text.size(); ++i)
	{
		const wchar_t c = text[i];
		if (IsSeparator(c, rules))
		{
			flush();
			continue;
		}
		if (rules.caseAndDigits && !current.empty() && StartsNewWord(text, i, current.back()))
		{
			flush();
		}
		current.push_back(c);
	}
	flush();
	return words;
}

wxString Capitalize(const wxString &word)
{
	if (word.empty())
		return word;
	return word.Left(1).Upper() + word.Mid(1).Lower();
}

wxString Join(const std::vector<wxString> &words, const wxString &separator)
{
	wxString result;
	for (size_t i = 0; i < words.size(); ++i)
	{
		if (i > 0)
			result += separator;
		result += words[i];
	}
	return result;
}
} // namespace

// Splits 'text' into words without knowing its convention
// Honours every boundary any supported convention could have produced
std::vector<wxString> PathConverterLogic::SplitWords(const wxString &text)
{
	return SplitByRules(text, BoundaryRules{true, true, true, true});
}

// Splits 'text' using only the boundaries the 'from' convention produces
std::vector<wxString> PathConverterLogic::SplitWords(const wxString &text, Convention from)
{
	switch (from)
	{
	case Convention::TitleCase:
		return SplitByRules(text, BoundaryRules{true, false, false, false});
	case Convention::FlatCase:
	case Convention::UpperFlatCase:
		return SplitByRules(text, BoundaryRules{false, false, false, false});
	case Convention::CamelCase:
	case Convention::UpperCamelCase:
		return SplitByRules(text, BoundaryRules{false, false, false, true});
	case Convention::SnakeCase:
	case Convention::UpperSnakeCase:
		return SplitByRules(text, BoundaryRules{false, true, false, false});
	case Convention::KebabCase:
		return SplitByRules(text, BoundaryRules{false, false, true, false});
	}
	return SplitWords(text);
}

// Re-joins 'words' with the capitalization and separator of the target convention
wxString PathConverterLogic::ConvertCase(const std::vector<wxString> &words, Convention to)
{
	std::vector<wxString> cased;
	cased.reserve(words.size());

	for (size_t i = 0; i < words.size(); ++i)
	{
		const wxString &word = words[i];
		switch (to)
		{
		case Convention::TitleCase:
		case Convention::UpperCamelCase:
			cased.push_back(Capitalize(word));
			break;
		case Convention::CamelCase:
			cased.push_back(i == 0 ? word.Lower() : Capitalize(word));
			break;
		case Convention::UpperFlatCase:
		case Convention::UpperSnakeCase:
			cased.push_back(word.Upper());
			break;
		case Convention::FlatCase:
		case Convention::SnakeCase:
		case Convention::KebabCase:
			cased.push_back(word.Lower());
			break;
		}
	}

	switch (to)
	{
	case Convention::TitleCase:
		return Join(cased, " ");
	case Convention::SnakeCase:
	case Convention::UpperSnakeCase:
		return Join(cased, "_");
	case Convention::KebabCase:
		return Join(cased, "-");
	default:
		return Join(cased, wxEmptyString);
	}
}
