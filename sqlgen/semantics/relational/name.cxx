// file      : sqlgen/semantics/relational/name.cxx
// license   : GNU GPL v3; see accompanying LICENSE file

#include <cctype> // std::tolower
#include <ostream>

#include <sqlgen/semantics/relational/name.hxx>

using namespace std;

namespace semantics
{
  namespace relational
  {
    string
    ukey (uname const& n)
    {
      string r (n);

      for (string::size_type i (0); i != r.size (); ++i)
        r[i] = static_cast<char> (
          tolower (static_cast<unsigned char> (r[i])));

      return r;
    }

    qname qname::
    qualifier () const
    {
      qname r;

      for (size_t i (0); i + 1 < components_.size (); ++i)
        r.append (components_[i]);

      return r;
    }

    string qname::
    string () const
    {
      std::string r;

      for (size_t i (0); i != components_.size (); ++i)
      {
        if (i != 0)
          r += '.';

        r += components_[i];
      }

      return r;
    }

    string qname::
    key () const
    {
      return ukey (string ());
    }

    ostream&
    operator<< (ostream& os, qname const& n)
    {
      return os << n.string ();
    }
  }
}
