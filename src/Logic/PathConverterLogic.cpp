#include "PathConverterLogic.h"

#include <vector>

// The canonical token for each convention, in the order they are listed in the help text
// Tokens are case-sensitive: "flat" and "FLAT" name different conventions
const std::vector<ConventionInfo> &PathConverterLogic::Conventions()
{
	static const std::vector<ConventionInfo> conventions = {
		{Convention::TitleCase, "title", "Title Case"},
		{Convention::FlatCase, "flat", "flatcase"},
		{Convention::UpperFlatCase, "FLAT", "UPPERFLATCASE"},
		{Convention::CamelCase, "camel", "camelCase"},
		{Convention::UpperCamelCase, "CAMEL", "CamelCase"},
		{Convention::SnakeCase, "snake", "snake_case"},
		{Convention::UpperSnakeCase, "SNAKE", "SNAKE_CASE"},
		{Convention::KebabCase, "kebab", "kebab-case"}};
	return conventions;
}
