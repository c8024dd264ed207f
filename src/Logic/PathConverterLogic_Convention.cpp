#include "PathConverterLogic.h"

#include <string>

// Maps a user-supplied token onto one of the supported conventions
ConventionParseResult PathConverterLogic::ParseConvention(const std::string &token)
{
	ConventionParseResult result;
	for (const auto &info : Conventions())
	{
		if (token == info.token)
		{
			result.convention = info.convention;
			result.success = true;
			return result;
		}
	}
	result.errorMessage = "Unsupported naming convention '" + token + "'";
	return result;
}

std::string PathConverterLogic::ConventionToken(Convention convention)
{
	for (const auto &info : Conventions())
	{
		if (info.convention == convention)
		{
			return info.token;
		}
	}
	return std::string();
}
