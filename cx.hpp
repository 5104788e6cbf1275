#include "nanoPattern.hpp"
#include <cassert>
#include <cstdint>
#include <array>
#include <initializer_list>
#ifndef NANOPATTERN_CX_HPP
#define NANOPATTERN_CX_HPP
namespace NanoPattern_detail{
    using NanoPattern::Match;
    using NanoPattern::MatchGroup;
    using NanoPattern::pattern_exception;
    constexpr std::size_t length(const char*src){std::size_t n=0;while(src[n]){n++;}return n;}
    // One byte consumed, one group spanning it.
    template<std::size_t N>constexpr Match<N> single(){
        std::array<MatchGroup,N>groups{};
        groups[0]=MatchGroup(0,1);
        return Match<N>(1,1,groups);
    }
    template<std::size_t N>struct ByteSet{
        std::array<std::uint8_t,N>bytes;
        std::size_t count;
        constexpr ByteSet(const char*src,std::size_t n):bytes(),count(n){
            if(n>N){throw pattern_exception("character set exceeds pattern capacity");}
            if(n&&src==nullptr){throw pattern_exception("null character set");}
            for(std::size_t i=0;i<n;i++){bytes[i]=std::uint8_t(src[i]);}
        }
        constexpr bool has(std::uint8_t c)const{
            for(std::size_t i=0;i<count;i++){if(bytes[i]==c){return true;}}
            return false;
        }
    };
}
namespace NanoPattern{
    template<std::size_t N>struct Wildcard{
        constexpr Match<N> match(const char*begin,const char*end)const{
            if(begin==end){return Match<N>::empty();}
            return NanoPattern_detail::single<N>();
        }
    };
    template<std::size_t N>struct Character{
        std::uint8_t character;
        constexpr explicit Character(char c):character(std::uint8_t(c)){}
        constexpr Match<N> match(const char*begin,const char*end)const{
            if(begin==end||std::uint8_t(*begin)!=character){return Match<N>::empty();}
            return NanoPattern_detail::single<N>();
        }
    };
    // Regex [abc]. At least one byte, at most N.
    template<std::size_t N>struct CharacterClass{
        NanoPattern_detail::ByteSet<N>characters;
        constexpr explicit CharacterClass(const char*chars)
            :CharacterClass(chars,chars?NanoPattern_detail::length(chars):0){}
        constexpr CharacterClass(const char*chars,std::size_t count):characters(chars,count){
            if(count==0){throw pattern_exception("empty character class");}
        }
        constexpr std::size_t size()const{return characters.count;}
        constexpr Match<N> match(const char*begin,const char*end)const{
            if(begin==end||!characters.has(std::uint8_t(*begin))){return Match<N>::empty();}
            return NanoPattern_detail::single<N>();
        }
    };
    // Regex [^abc]. An empty exclusion set matches any byte.
    template<std::size_t N>struct InvertedCharacterClass{
        NanoPattern_detail::ByteSet<N>characters;
        constexpr explicit InvertedCharacterClass(const char*chars)
            :InvertedCharacterClass(chars,chars?NanoPattern_detail::length(chars):0){}
        constexpr InvertedCharacterClass(const char*chars,std::size_t count):characters(chars,count){}
        constexpr std::size_t size()const{return characters.count;}
        constexpr Match<N> match(const char*begin,const char*end)const{
            if(begin==end||characters.has(std::uint8_t(*begin))){return Match<N>::empty();}
            return NanoPattern_detail::single<N>();
        }
    };
    // Members are borrowed and matched left to right with no backtracking.
    template<std::size_t N>struct Concatenation{
        std::array<const Pattern<N>*,N>patterns;
        std::size_t count;
        std::size_t maxGroups;
        bool allNullable;
        constexpr Concatenation(std::initializer_list<const Pattern<N>*>members)
            :Concatenation(members.begin(),members.size()){}
        constexpr Concatenation(const Pattern<N>*const*members,std::size_t n)
            :patterns(),count(n),maxGroups(1),allNullable(true){
            if(n==0){throw pattern_exception("empty concatenation");}
            if(n>N){throw pattern_exception("concatenation exceeds pattern capacity");}
            for(std::size_t i=0;i<n;i++){
                if(members[i]==nullptr){throw pattern_exception("null concatenation member");}
                patterns[i]=members[i];
                maxGroups+=members[i]->captures()-1;
                allNullable=allNullable&&members[i]->nullable();
            }
            if(maxGroups>N){throw pattern_exception("concatenation captures exceed pattern capacity");}
        }
        constexpr Match<N> match(const char*begin,const char*end)const{
            std::array<MatchGroup,N>groups{};
            std::size_t consumed=0,matched=1;
            for(std::size_t i=0;i<count;i++){
                const Match<N> sub=patterns[i]->match(begin+consumed,end);
                if(!sub.matched()){
                    // a nullable member matched the empty string here
                    if(patterns[i]->nullable()){continue;}
                    return Match<N>::empty();
                }
                for(std::size_t g=1;g<sub.groupsMatched;g++){
                    assert(matched<N);
                    groups[matched++]=sub.groups[g].shifted(consumed);
                }
                consumed+=sub.bytesConsumed;
            }
            if(consumed==0){return Match<N>::empty();}
            groups[0]=MatchGroup(0,consumed);
            return Match<N>(consumed,matched,groups);
        }
    };
    // Regex (x). Reports its own span first, then every group of the wrapped pattern.
    template<std::size_t N>struct Group{
        const Pattern<N>*pattern;
        std::size_t maxGroups;
        constexpr explicit Group(const Pattern<N>*p):pattern(p),maxGroups(0){
            if(p==nullptr){throw pattern_exception("null group pattern");}
            maxGroups=1+p->captures();
            if(maxGroups>N){throw pattern_exception("group captures exceed pattern capacity");}
        }
        constexpr Match<N> match(const char*begin,const char*end)const{
            const Match<N> sub=pattern->match(begin,end);
            if(!sub.matched()){return Match<N>::empty();}
            std::array<MatchGroup,N>groups{};
            groups[0]=MatchGroup(0,sub.bytesConsumed);
            for(std::size_t g=0;g<sub.groupsMatched;g++){
                assert(g+1<N);
                groups[g+1]=sub.groups[g];
            }
            return Match<N>(sub.bytesConsumed,sub.groupsMatched+1,groups);
        }
    };
    // Regex x?. Never fails; a miss is reported as the empty match.
    template<std::size_t N>struct Optional{
        const Pattern<N>*pattern;
        constexpr explicit Optional(const Pattern<N>*p):pattern(p){
            if(p==nullptr){throw pattern_exception("null optional pattern");}
        }
        constexpr Match<N> match(const char*begin,const char*end)const{
            const Match<N> sub=pattern->match(begin,end);
            if(!sub.matched()){return Match<N>::empty();}
            return sub;
        }
    };
    template<std::size_t N>struct Pattern{
        static_assert(N>0,"pattern capacity must be positive");
        enum class Type:std::uint8_t{WILDCARD,CHARACTER,CHARACTER_CLASS,INVERTED_CHARACTER_CLASS,CONCATENATION,GROUP,ZERO_OR_ONE}type;
        constexpr static const Type WILDCARD=Type::WILDCARD;
        constexpr static const Type CHARACTER=Type::CHARACTER;
        constexpr static const Type CHARACTER_CLASS=Type::CHARACTER_CLASS;
        constexpr static const Type INVERTED_CHARACTER_CLASS=Type::INVERTED_CHARACTER_CLASS;
        constexpr static const Type CONCATENATION=Type::CONCATENATION;
        constexpr static const Type GROUP=Type::GROUP;
        constexpr static const Type ZERO_OR_ONE=Type::ZERO_OR_ONE;
        union{
            Wildcard<N> wildcard;
            Character<N> character;
            CharacterClass<N> characterClass;
            InvertedCharacterClass<N> invertedCharacterClass;
            Concatenation<N> concatenation;
            Group<N> group;
            Optional<N> optional;
        };
        constexpr Pattern(const Wildcard<N>&w):type(WILDCARD),wildcard(w){}
        constexpr Pattern(const Character<N>&c):type(CHARACTER),character(c){}
        constexpr Pattern(const CharacterClass<N>&c):type(CHARACTER_CLASS),characterClass(c){}
        constexpr Pattern(const InvertedCharacterClass<N>&c):type(INVERTED_CHARACTER_CLASS),invertedCharacterClass(c){}
        constexpr Pattern(const Concatenation<N>&c):type(CONCATENATION),concatenation(c){}
        constexpr Pattern(const Group<N>&g):type(GROUP),group(g){}
        constexpr Pattern(const Optional<N>&o):type(ZERO_OR_ONE),optional(o){}
        constexpr Match<N> match(const char*begin,const char*end)const{
            switch(type){
            case WILDCARD:return wildcard.match(begin,end);
            case CHARACTER:return character.match(begin,end);
            case CHARACTER_CLASS:return characterClass.match(begin,end);
            case INVERTED_CHARACTER_CLASS:return invertedCharacterClass.match(begin,end);
            case CONCATENATION:return concatenation.match(begin,end);
            case GROUP:return group.match(begin,end);
            case ZERO_OR_ONE:return optional.match(begin,end);
            }
            return Match<N>::empty();
        }
        // Largest groupsMatched a successful match can report.
        constexpr std::size_t captures()const{
            switch(type){
            case CONCATENATION:return concatenation.maxGroups;
            case GROUP:return group.maxGroups;
            case ZERO_OR_ONE:return optional.pattern->captures();
            default:return 1;
            }
        }
        // True if an empty match is a success rather than a failure.
        constexpr bool nullable()const{
            switch(type){
            case CONCATENATION:return concatenation.allNullable;
            case ZERO_OR_ONE:return true;
            default:return false;
            }
        }
    };
}
#endif
