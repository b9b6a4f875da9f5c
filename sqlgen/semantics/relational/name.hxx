// file      : sqlgen/semantics/relational/name.hxx
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef SQLGEN_SEMANTICS_RELATIONAL_NAME_HXX
#define SQLGEN_SEMANTICS_RELATIONAL_NAME_HXX

#include <string>
#include <vector>
#include <iosfwd>

namespace semantics
{
  namespace relational
  {
    typedef std::string uname;

    // Case-insensitive key for the unqualified name.
    //
    std::string
    ukey (uname const&);

    // Qualified name, for example, dbo.Users.
    //
    class qname
    {
    public:
      typedef relational::uname uname_type;

      qname () {}

      explicit
      qname (uname_type const& n)
      {
        append (n);
      }

      qname (uname_type const& p, uname_type const& n)
      {
        append (p);
        append (n);
      }

      void
      append (uname_type const& n)
      {
        components_.push_back (n);
      }

      void
      append (qname const& n)
      {
        components_.insert (components_.end (),
                            n.components_.begin (),
                            n.components_.end ());
      }

      // Name is the last component.
      //
      uname_type const&
      uname () const
      {
        return components_.back ();
      }

      qname
      qualifier () const;

      bool
      qualified () const
      {
        return components_.size () > 1;
      }

      bool
      empty () const
      {
        return components_.empty ();
      }

      std::size_t
      size () const
      {
        return components_.size ();
      }

      uname_type const&
      operator[] (std::size_t i) const
      {
        return components_[i];
      }

    public:
      // Components joined with the '.' separator.
      //
      std::string
      string () const;

      // Case-insensitive key.
      //
      std::string
      key () const;

    private:
      std::vector<uname_type> components_;
    };

    inline bool
    operator== (qname const& x, qname const& y)
    {
      return x.key () == y.key ();
    }

    inline bool
    operator!= (qname const& x, qname const& y)
    {
      return !(x == y);
    }

    inline bool
    operator< (qname const& x, qname const& y)
    {
      return x.key () < y.key ();
    }

    std::ostream&
    operator<< (std::ostream&, qname const&);
  }
}

#endif // SQLGEN_SEMANTICS_RELATIONAL_NAME_HXX
