// file      : sqlgen/diagnostics.cxx
// license   : GNU GPL v3; see accompanying LICENSE file

#include <sqlgen/diagnostics.hxx>

using namespace std;

ostream&
operator<< (ostream& os, location const& l)
{
  os << l.file;

  if (l.line != 0)
  {
    os << ':' << l.line;

    if (l.column != 0)
      os << ':' << l.column;
  }

  return os;
}

static const char* kind_[] =
{
  "parse error",
  "duplicate definition",
  "reference error",
  "constraint error",
  "type rule error",
  "output collision",
  "unmapped type"
};

ostream&
operator<< (ostream& os, diagnostic::kind_type k)
{
  return os << kind_[k];
}

static const char* severity_[] =
{
  "error",
  "warning",
  "info"
};

ostream&
operator<< (ostream& os, diagnostic const& d)
{
  if (!d.loc.file.empty ())
    os << d.loc << ": ";

  return os << severity_[d.severity] << ": " << d.message;
}

//
// diagnostics
//

diagnostics::
diagnostics ()
    : buf_ (*this), os_ (&buf_)
{
}

diagnostics::
diagnostics (diagnostics const& x)
    : list_ (x.list_), buf_ (*this), os_ (&buf_)
{
}

diagnostics& diagnostics::
operator= (diagnostics const& x)
{
  if (this != &x)
  {
    commit ();
    list_ = x.list_;
  }

  return *this;
}

bool diagnostics::
fatal () const
{
  for (iterator i (begin ()); i != end (); ++i)
    if (i->fatal ())
      return true;

  return false;
}

diagnostics::size_type diagnostics::
count (diagnostic::kind_type k) const
{
  size_type r (0);

  for (iterator i (begin ()); i != end (); ++i)
    if (i->kind == k)
      r++;

  return r;
}

diagnostics::size_type diagnostics::
count (diagnostic::severity_type s) const
{
  size_type r (0);

  for (iterator i (begin ()); i != end (); ++i)
    if (i->severity == s)
      r++;

  return r;
}

ostream& diagnostics::
record (diagnostic::kind_type k,
        diagnostic::severity_type s,
        location const& l)
{
  // Commit the previous entry if it was never flushed.
  //
  commit ();

  pending_ = diagnostic (k, s, l, string ());
  return os_;
}

void diagnostics::
append (diagnostic const& d)
{
  commit ();
  list_.push_back (d);
}

void diagnostics::
append (diagnostics const& x)
{
  commit ();
  list_.insert (list_.end (), x.list_.begin (), x.list_.end ());
}

void diagnostics::
commit ()
{
  string s (buf_.str ());

  if (s.empty ())
    return;

  // Get rid of the trailing newline if any.
  //
  if (s[s.size () - 1] == '\n')
    s.resize (s.size () - 1);

  pending_.message = s;
  list_.push_back (pending_);
  buf_.str (string ());
}

int diagnostics::streambuf::
sync ()
{
  d_.commit ();
  return 0;
}

ostream&
error (diagnostics& d, diagnostic::kind_type k, location const& l)
{
  return d.record (k, diagnostic::error, l);
}

ostream&
warn (diagnostics& d, diagnostic::kind_type k, location const& l)
{
  return d.record (k, diagnostic::warning, l);
}

ostream&
info (diagnostics& d, diagnostic::kind_type k, location const& l)
{
  return d.record (k, diagnostic::info, l);
}
