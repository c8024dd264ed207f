#include "PathConverterLogic.h"

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace // Anonymous namespace for internal linkage helper functions
{
// The elements of 'path' without the empty element a trailing separator produces
std::vector<fs::path> NonEmptyElements(const fs::path &path)
{
	std::vector<fs::path> elements;
	for (const auto &element : path)
	{
		if (!element.empty())
		{
			elements.push_back(element);
		}
	}
	return elements;
}

// Root names, root directories, "." and ".." are never renamed
bool IsStructural(const fs::path &element)
{
	return element.has_root_name() || element.has_root_directory() || element == "." || element == "..";
}
} // namespace

// Converts only the final segment of 'path'; parent segments are left untouched
PathResult PathConverterLogic::ConvertBasename(const fs::path &path, const ConversionRequest &request)
{
	PathResult result;

	fs::path target = path;
	if (!target.has_filename() && target.has_relative_path())
	{
		target = target.parent_path(); // "dir/" names "dir"
	}

	const fs::path name = target.filename();
	if (name.empty() || name == "." || name == "..")
	{
		// A root or a relative reference has no filename to convert
		result.value = path;
		result.success = true;
		return result;
	}

	ComponentResult converted = ConvertComponent(name.string(), request);
	if (!converted.success)
	{
		result.error = converted.error;
		return result;
	}

	result.value = target.parent_path() / converted.value;
	result.success = true;
	return result;
}

// Converts every normal segment of 'path' independently
// The first segment that fails aborts the whole path, no partial result is returned
PathResult PathConverterLogic::ConvertFull(const fs::path &path, const ConversionRequest &request)
{
	PathResult result;
	fs::path converted;

	for (const auto &element : NonEmptyElements(path))
	{
		if (IsStructural(element))
		{
			converted /= element;
			continue;
		}

		ComponentResult component = ConvertComponent(element.string(), request);
		if (!component.success)
		{
			result.error = component.error;
			return result;
		}
		converted /= component.value;
	}

	result.value = converted;
	result.success = true;
	return result;
}

// Component-wise prefix test, so "/a/bc" does not start with "/a/b"
bool PathConverterLogic::StartsWithComponents(const fs::path &path, const fs::path &prefix)
{
	const std::vector<fs::path> pathElements = NonEmptyElements(path);
	const std::vector<fs::path> prefixElements = NonEmptyElements(prefix);

	if (prefixElements.size() > pathElements.size())
	{
		return false;
	}
	for (size_t i = 0; i < prefixElements.size(); ++i)
	{
		if (pathElements[i] != prefixElements[i])
		{
			return false;
		}
	}
	return true;
}

// Same as ConvertFull, except that a leading 'prefix' is kept verbatim
// If 'path' does not start with 'prefix' the prefix has no effect
PathResult PathConverterLogic::ConvertFullExceptPrefix(const fs::path &path, const fs::path &prefix, const ConversionRequest &request)
{
	if (!StartsWithComponents(path, prefix))
	{
		return ConvertFull(path, request);
	}

	const std::vector<fs::path> pathElements = NonEmptyElements(path);
	const size_t prefixLength = NonEmptyElements(prefix).size();

	fs::path remainder;
	for (size_t i = prefixLength; i < pathElements.size(); ++i)
	{
		remainder /= pathElements[i];
	}

	PathResult result;
	if (remainder.empty())
	{
		// The path is the prefix itself
		result.value = path;
		result.success = true;
		return result;
	}

	result = ConvertFull(remainder, request);
	if (result.success)
	{
		result.value = prefix / result.value;
	}
	return result;
}
