/*
 * Regular expressions
 * Compiled patterns and the operations on them: contains, split, find, replace
 *
 * (c) Copyright Clifford Heath 2022. See LICENSE file for usage rights.
 */
#include	<rxpp.h>

RxPattern
RxPattern::fromStringWith(const RxOptions& options, const std::string& pattern, Error* err_return, RxFeature reject_features)
{
	RxCompiler	compiler(pattern, options, RxFeature::AllFeatures, reject_features);
	RxProgram*	program = 0;

	if (err_return)
		*err_return = Error();
	if (!compiler.compile(program))
	{
		if (err_return)
			*err_return = Error(ErrNum(RXERR_SET, compiler.errorCode()), compiler.errorMessage(), compiler.errorOffset());
		return RxPattern();
	}
	return RxPattern(program);
}

bool
RxPattern::contains(const std::string& input) const
{
	if (!compiled)
		return false;

	RxText		target(input);
	RxScanner	scanner(*compiled, target, RxCount::AtMost(1));
	return scanner.next();
}

std::vector<std::string>
RxPattern::split(RxCount count, const std::string& input) const
{
	std::vector<std::string>	pieces;

	if (!compiled)
	{
		pieces.push_back(input);
		return pieces;
	}

	RxText		target(input);
	RxScanner	scanner(*compiled, target, count);
	CharNum		previous = 0;	// End of the last separator
	while (scanner.next())
	{
		pieces.push_back(target.slice(previous, scanner.result().offset()));
		previous = scanner.result().end();
	}
	pieces.push_back(target.slice(previous, target.length()));
	return pieces;
}

std::vector<RxMatch>
RxPattern::find(RxCount count, const std::string& input) const
{
	std::vector<RxMatch>	matches;

	scan(count, input,
		[&](const RxMatch& match) -> bool
		{
			matches.push_back(match);
			return true;
		});
	return matches;
}

std::string
RxPattern::replace(
	RxCount count,
	const std::function<std::string(const RxMatch&)>& replacement,
	const std::string& input
) const
{
	if (!compiled)
		return input;

	RxText		target(input);
	RxScanner	scanner(*compiled, target, count);
	std::string	output;
	CharNum		previous = 0;
	while (scanner.next())
	{
		output += target.slice(previous, scanner.result().offset());
		output += replacement(scanner.match());
		previous = scanner.result().end();
	}
	output += target.slice(previous, target.length());
	return output;
}

/*
 * Expand a replacement template for one match:
 *	$$ is $, $& is the match, $` and $' are the text before and after it,
 *	$n and $nn are groups, $<name> is a named group.
 * A numbered group that doesn't exist stays as written. A group that didn't
 * participate is empty. Anything else is literal.
 */
static std::string
expandTemplate(const RxProgram& program, const RxMatch& match, const std::string& templ, const RxText& target)
{
	std::string	output;
	int		groups = (int)match.submatches.size();
	bool		has_names = false;

	for (int g = 1; g <= groups; g++)
		if (!program.groupName(g).empty())
			has_names = true;

	auto	group_text =
		[&](int group) -> std::string
		{
			if (group < 1 || group > groups)
				return std::string();
			return match.submatches[group-1].text;
		};

	for (size_t i = 0; i < templ.size(); i++)
	{
		char	c = templ[i];
		if (c != '$' || i+1 == templ.size())
		{
			output += c;
			continue;
		}

		char	n = templ[i+1];
		switch (n)
		{
		case '$':
			output += '$';
			i++;
			continue;

		case '&':
			output += match.text;
			i++;
			continue;

		case '`':
			output += target.slice(0, match.index);
			i++;
			continue;

		case '\'':
			output += target.slice(match.index+RxText(match.text).length(), target.length());
			i++;
			continue;

		case '<':
		{
			size_t	close = templ.find('>', i+2);
			if (!has_names || close == std::string::npos)
				break;
			output += group_text(program.groupNumber(templ.substr(i+2, close-i-2)));
			i = close;
			continue;
		}

		default:
			if (n < '0' || n > '9')
				break;
			{
				int	number = n - '0';
				if (i+2 < templ.size() && templ[i+2] >= '0' && templ[i+2] <= '9'
				 && number*10 + (templ[i+2]-'0') >= 1 && number*10 + (templ[i+2]-'0') <= groups)
				{
					output += group_text(number*10 + (templ[i+2]-'0'));
					i += 2;
					continue;
				}
				if (number >= 1 && number <= groups)
				{
					output += group_text(number);
					i++;
					continue;
				}
			}
			break;
		}
		output += c;		// A $ that doesn't start a substitution
	}
	return output;
}

std::string
RxPattern::replaceWith(RxCount count, const std::string& templ, const std::string& input) const
{
	if (!compiled)
		return input;

	RxText		target(input);
	RxScanner	scanner(*compiled, target, count);
	std::string	output;
	CharNum		previous = 0;
	while (scanner.next())
	{
		output += target.slice(previous, scanner.result().offset());
		output += expandTemplate(*compiled, scanner.match(), templ, target);
		previous = scanner.result().end();
	}
	output += target.slice(previous, target.length());
	return output;
}

std::string
RxPattern::expand(const RxMatch& match, const std::string& templ, const std::string& input) const
{
	if (!compiled)
		return templ;
	return expandTemplate(*compiled, match, templ, RxText(input));
}

void
RxPattern::scan(RxCount count, const std::string& input, const std::function<bool(const RxMatch&)>& func) const
{
	if (!compiled)
		return;

	RxText		target(input);
	RxScanner	scanner(*compiled, target, count);
	scanner.scan(func);
}

bool
RxPattern::matchAt(const std::string& input, CharNum offset, RxMatch& match) const
{
	if (!compiled)
		return false;

	RxText		target(input);
	RxResult	result = compiled->matchAt(target, offset);
	if (!result.succeeded())
		return false;
	match = RxScanner::project(target, result, 1);
	return true;
}

bool
RxPattern::matchAfter(const std::string& input, CharNum offset, RxMatch& match) const
{
	if (!compiled)
		return false;

	RxText		target(input);
	RxResult	result = compiled->matchAfter(target, offset);
	if (!result.succeeded())
		return false;
	match = RxScanner::project(target, result, 1);
	return true;
}

int
RxPattern::groupCount() const
{
	return compiled ? compiled->maxCapture()-1 : 0;
}

std::string
RxPattern::groupName(int group_number) const
{
	return compiled ? compiled->groupName(group_number) : std::string();
}

int
RxPattern::groupNumber(const std::string& name) const
{
	return compiled ? compiled->groupNumber(name) : -1;
}

std::string
RxPattern::source() const
{
	return compiled ? compiled->source() : std::string();
}

RxOptions
RxPattern::options() const
{
	return compiled ? compiled->options() : RxOptions();
}
