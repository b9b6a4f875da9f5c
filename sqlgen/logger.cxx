// file      : sqlgen/logger.cxx
// license   : GNU GPL v3; see accompanying LICENSE file

#include <ostream>

#include <sqlgen/logger.hxx>

using namespace std;

void stream_logger::
log (level l, string const& m)
{
  lock_guard<mutex> lock (mutex_);

  if (l == trace)
    os_ << "  ";

  os_ << m << endl;
}
