#ifndef PARTICLEMORPH_OVERLOADED_HPP
#define PARTICLEMORPH_OVERLOADED_HPP

template<class... Fs>
struct overloaded : Fs...
{
	using Fs::operator()...;
};

// Deduction guide for C++17
template<class... Fs>
overloaded(Fs...) -> overloaded<Fs...>;

#endif // PARTICLEMORPH_OVERLOADED_HPP
