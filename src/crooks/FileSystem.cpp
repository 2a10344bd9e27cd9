#include "FileSystem.h"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <stdexcept>

#include "utils.h"


namespace FileSystem {

std::string join(const std::string& dir, const std::string& file)
{
	if ( dir.empty() ) {
		return file;
	}
	else if ( dir.back() == separator ) {
		return dir + file;
	}
	return dir + separator + file;
}


std::string realpath(const std::string& path)
{
	CROOKS_ASSERT( ! path.empty(), "no path given" );

	char resolved[PATH_MAX];
	if ( ::realpath(path.c_str(), resolved) == nullptr ) {
		throw std::runtime_error("unable to resolve path \"" + path + "\": " + std::strerror(errno));
	}
	return std::string(resolved);
}


std::string dirname(const std::string& path)
{
	const auto pos = path.find_last_of(separator);
	if ( pos == std::string::npos ) {
		return ".";
	}
	else if ( pos == 0 ) {
		return std::string(1, separator);
	}
	return path.substr(0, pos);
}


bool isAbsolutePath(const std::string& path)
{
	return ( (not path.empty()) and path.front() == separator );
}


std::string resolveRelativePath(const std::string& path, const std::string& base_dir)
{
	CROOKS_ASSERT( ! path.empty(), "no path given" );

	if ( isAbsolutePath(path) ) {
		return realpath(path);
	}
	return realpath( join(base_dir, path) );
}

} // end namespace FileSystem
