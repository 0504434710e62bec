#include "custody/entrypoints.hpp"

using namespace custody;

int main(int argc, char* argv[])
{
	vitex::runtime scope;
	auto environment = os::process::parse_args(argc, argv, (size_t)args_format::key | (size_t)args_format::key_value);
	return entrypoints::node(environment);
}
