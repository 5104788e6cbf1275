#include "nanoPattern.hpp"
#include "cx.hpp"
#include <cstdint>
#include <cstdio>
#ifndef NANOPATTERN_DEBUG_HPP
#define NANOPATTERN_DEBUG_HPP
namespace NanoPattern_detail{
    // Writes one pattern byte, escaping regex metacharacters and non-printables as \xHH.
    void print_byte(std::FILE*out,std::uint8_t c,bool inClass);
    void print_group(std::FILE*out,std::size_t idx,const MatchGroup&group,const char*input);
}
namespace NanoPattern{
    template<std::size_t N>void print_pattern(const Pattern<N>&pattern,std::FILE*out=stderr){
        using P=Pattern<N>;
        using NanoPattern_detail::print_byte;
        switch(pattern.type){
        case P::WILDCARD:std::fputc('.',out);break;
        case P::CHARACTER:print_byte(out,pattern.character.character,false);break;
        case P::CHARACTER_CLASS:{
            const auto&set=pattern.characterClass.characters;
            std::fputc('[',out);
            for(std::size_t i=0;i<set.count;i++){print_byte(out,set.bytes[i],true);}
            std::fputc(']',out);
            break;
        }
        case P::INVERTED_CHARACTER_CLASS:{
            const auto&set=pattern.invertedCharacterClass.characters;
            std::fputs("[^",out);
            for(std::size_t i=0;i<set.count;i++){print_byte(out,set.bytes[i],true);}
            std::fputc(']',out);
            break;
        }
        case P::CONCATENATION:{
            const Concatenation<N>&cat=pattern.concatenation;
            for(std::size_t i=0;i<cat.count;i++){print_pattern(*cat.patterns[i],out);}
            break;
        }
        case P::GROUP:{
            std::fputc('(',out);
            print_pattern(*pattern.group.pattern,out);
            std::fputc(')',out);
            break;
        }
        case P::ZERO_OR_ONE:{
            const P&content=*pattern.optional.pattern;
            if(content.type==P::CONCATENATION||content.type==P::ZERO_OR_ONE){
                std::fputs("(?:",out);print_pattern(content,out);std::fputc(')',out);
            }else{print_pattern(content,out);}
            std::fputc('?',out);
            break;
        }
        }
    }
    template<std::size_t N>void print_match(const Match<N>&match,const char*input,std::FILE*out=stderr){
        if(!match.matched()){std::fprintf(out,"no match\n");return;}
        std::fprintf(out,"matched %zu bytes, %zu groups\n",match.bytesConsumed,match.groupsMatched);
        for(std::size_t i=0;i<match.groupsMatched;i++){NanoPattern_detail::print_group(out,i,match.groups[i],input);}
    }
}
#endif
