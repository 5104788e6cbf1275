#include "nanoPattern.hpp"
#include "cx.hpp"
#include "debug.hpp"
#include <cstdio>
#include <cstring>
using namespace NanoPattern;
namespace{
    constexpr std::size_t CAPACITY=10;
    using P=Pattern<CAPACITY>;
    // DIMACS literal: (-)?([1-9][0-9]?[0-9]?)[ \t\n]?
    constexpr P minus=Character<CAPACITY>('-');
    constexpr P negation=Group<CAPACITY>(&minus);
    constexpr P sign=Optional<CAPACITY>(&negation);
    constexpr P leading=CharacterClass<CAPACITY>("123456789");
    constexpr P digit=CharacterClass<CAPACITY>("0123456789");
    constexpr P moreDigits=Optional<CAPACITY>(&digit);
    constexpr P digits=Concatenation<CAPACITY>{&leading,&moreDigits,&moreDigits};
    constexpr P magnitude=Group<CAPACITY>(&digits);
    constexpr P blank=CharacterClass<CAPACITY>(" \t\n");
    constexpr P separator=Optional<CAPACITY>(&blank);
    constexpr P literal=Concatenation<CAPACITY>{&sign,&magnitude,&separator};
}
int main(int argc,char**argv){
    bool verbose=false;
    int first=1;
    if(argc>1&&std::strcmp(argv[1],"-v")==0){verbose=true;first=2;}
    if(argc<=first){
        std::fprintf(stderr,"usage: %s [-v] string...\n",argc>0?argv[0]:"progname");
        return 1;
    }
    if(verbose){
        std::fprintf(stderr,"Pattern ");
        print_pattern(literal,stderr);
        std::fprintf(stderr," (%zu captures)\n",literal.captures());
    }
    for(int i=first;i<argc;i++){
        const Match<CAPACITY> matches=literal.match(argv[i],argv[i]+std::strlen(argv[i]));
        if(verbose){print_match(matches,argv[i],stderr);}
        if(!matches.matched()){std::printf("%s does not match\n",argv[i]);continue;}
        std::printf("%s matches:",argv[i]);
        for(std::size_t g=0;g<matches.groupsMatched;g++){
            std::putchar(' ');
            std::string_view text=matches.text(argv[i],g);
            std::fwrite(text.data(),1,text.size(),stdout);
        }
        std::printf("\n");
    }
    return 0;
}
