// Compiles the Boost.Redis implementation once for the whole program.
#include <boost/redis/src.hpp>
