// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Configuration Class

   A tree of scoped names such as Acquire::http::Timeout, each with a
   string value. Command line options, the configuration files and the
   built-in defaults all end up here, the pipeline only ever reads.

     std::clog << _config->Find("Debfetch::Destination") << std::endl;

   A trailing :: in a name passed to Set appends an anonymous child,
   which is how ordered lists like Debfetch::Architectures are built.
   FindVector reads them back (or splits a comma separated value).

   ##################################################################### */
									/*}}}*/
#ifndef DEBFETCH_CONFIGURATION_H
#define DEBFETCH_CONFIGURATION_H

#include <debfetch-pkg/macros.h>

#include <iostream>
#include <string>
#include <vector>

class DEBFETCH_PUBLIC Configuration
{
   public:

   struct Item
   {
      std::string Value;
      std::string Tag;
      Item *Parent;
      Item *Child;
      Item *Next;

      std::string FullTag(const Item *Stop = 0) const;

      Item() : Parent(0), Child(0), Next(0) {};
   };

   private:

   Item *Root;
   bool ToFree;

   Item *Lookup(Item *Head,const char *S,unsigned long const &Len,bool const &Create);
   Item *Lookup(const char *Name,const bool &Create);
   inline const Item *Lookup(const char *Name) const
   {
      return const_cast<Configuration *>(this)->Lookup(Name,false);
   }

   public:

   std::string Find(const char *Name,const char *Default = 0) const;
   std::string Find(std::string const &Name,const char *Default = 0) const {return Find(Name.c_str(),Default);};
   std::string Find(std::string const &Name, std::string const &Default) const {return Find(Name.c_str(),Default.c_str());};
   std::string FindFile(const char *Name,const char *Default = 0) const;
   std::string FindDir(const char *Name,const char *Default = 0) const;
   /** return a list of child options
    *
    * A list can be given as children (Name:: "a"; Name:: "b";) or as a
    * comma separated value, the Default is used if neither exists.
    *
    * \param Name of the parent node
    * \param Default list of values separated by commas */
   std::vector<std::string> FindVector(const char *Name, std::string const &Default = "") const;
   std::vector<std::string> FindVector(std::string const &Name, std::string const &Default = "") const { return FindVector(Name.c_str(), Default); };
   int FindI(const char *Name,int const &Default = 0) const;
   int FindI(std::string const &Name,int const &Default = 0) const {return FindI(Name.c_str(),Default);};
   bool FindB(const char *Name,bool const &Default = false) const;
   bool FindB(std::string const &Name,bool const &Default = false) const {return FindB(Name.c_str(),Default);};

   inline void Set(const std::string &Name,const std::string &Value) {Set(Name.c_str(),Value);};
   void CndSet(const char *Name,const std::string &Value);
   void CndSet(const char *Name,const int Value);
   void Set(const char *Name,const std::string &Value);
   void Set(const char *Name,const int &Value);

   inline bool Exists(const std::string &Name) const {return Exists(Name.c_str());};
   bool Exists(const char *Name) const;

   void Clear(const std::string &Name);
   void Clear(std::string const &List, std::string const &Value);

   inline const Item *Tree(const char *Name) const {return Lookup(Name);};

   inline void Dump() { Dump(std::clog); };
   void Dump(std::ostream& str);

   explicit Configuration(const Item *Root);
   Configuration();
   ~Configuration();
};

DEBFETCH_PUBLIC extern Configuration *_config;

DEBFETCH_PUBLIC bool ReadConfigFile(Configuration &Conf,const std::string &FName,
		    unsigned const &Depth = 0);

DEBFETCH_PUBLIC bool ReadConfigDir(Configuration &Conf,const std::string &Dir,
		   unsigned const &Depth = 0);

#endif
