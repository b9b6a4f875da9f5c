// file      : sqlgen/semantics/relational/primary-key.hxx
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef SQLGEN_SEMANTICS_RELATIONAL_PRIMARY_KEY_HXX
#define SQLGEN_SEMANTICS_RELATIONAL_PRIMARY_KEY_HXX

#include <sqlgen/semantics/relational/elements.hxx>
#include <sqlgen/semantics/relational/key.hxx>

namespace semantics
{
  namespace relational
  {
    class primary_key: public key
    {
    public:
      bool
      clustered () const
      {
        return clustered_;
      }

    public:
      primary_key (location const& l, bool named_in_source, bool clustered)
          : key (l, named_in_source), clustered_ (clustered)
      {
      }

      virtual string
      kind () const
      {
        return "primary key";
      }

    private:
      bool clustered_;
    };
  }
}

#endif // SQLGEN_SEMANTICS_RELATIONAL_PRIMARY_KEY_HXX
