#include "detector/pattern_catalog.h"

namespace {

constexpr bool ICASE = true;
constexpr bool EXACT = false;

using C = RuleCategory;

std::vector<CatalogRule> buildCatalog() {
    return {
        /* ---------- DIRECT INSTRUCTION OVERRIDE ---------- */

        {C::DirectInjection, R"(ignore\s{1,64}(?:all\s{1,64})?(?:previous|prior|above|earlier|preceding)\s{1,64}(?:instructions?|prompts?|rules?|guidelines?|context))", "ignore_previous_instructions", ICASE},
        {C::DirectInjection, R"(forget\s{1,64}(?:all\s{1,64})?(?:previous|prior|your|earlier)\s{1,64}(?:instructions?|prompts?|rules?|training|context))", "forget_instructions", ICASE},
        {C::DirectInjection, R"(disregard\s{1,64}(?:all\s{1,64})?(?:previous|prior|your|earlier|the)\s{1,64}(?:instructions?|prompts?|rules?|guidelines?))", "disregard_instructions", ICASE},
        {C::DirectInjection, R"(override\s{1,64}(?:all\s{1,64})?(?:previous|prior|your|safety|security)\s{1,64}(?:instructions?|prompts?|rules?|settings?))", "override_instructions", ICASE},
        {C::DirectInjection, R"(ignore\s{1,64}(?:all\s{1,64})?(?:safety|security)\s{1,64}(?:rules?|protocols?|guidelines?|restrictions?))", "ignore_safety", ICASE},
        {C::DirectInjection, R"(bypass\s{1,64}(?:all\s{1,64})?(?:safety|security|content)\s{1,64}(?:filters?|rules?|restrictions?))", "bypass_safety", ICASE},

        {C::DirectInjection, R"((?:new|updated|revised|real)\s{1,64}(?:instructions?|prompts?|rules?|guidelines?)(?:\s{0,64}:|\s{1,64}are))", "new_instructions", ICASE},
        {C::DirectInjection, R"((?:your|the)\s{1,64}(?:new|real|actual|true)\s{1,64}(?:instructions?|prompts?|task|purpose)(?:\s{0,64}:|\s{1,64}is))", "real_instructions", ICASE},
        {C::DirectInjection, R"(from\s{1,64}now\s{1,64}on[,\s]{1,64}(?:you|your|ignore|forget|disregard))", "from_now_on", ICASE},

        {C::DirectInjection, R"(system\s{0,64}(?:prompt|message|instruction)s?\s{0,64}:)", "system_prompt_injection", ICASE},
        {C::DirectInjection, R"(\[(?:system|sys|admin|root)\])", "system_tag_injection", ICASE},
        {C::DirectInjection, R"(<\s{0,64}(?:system|sys|admin|root)\s{0,64}>)", "system_xml_injection", ICASE},
        {C::DirectInjection, R"(###\s{0,64}(?:system|instruction|admin))", "system_markdown_injection", ICASE},

        {C::DirectInjection, R"(end\s{1,64}of\s{1,64}(?:system|user|assistant)\s{1,64}(?:message|prompt|input))", "context_boundary_manipulation", ICASE},
        {C::DirectInjection, R"((?:begin|start)\s{1,64}(?:new\s{1,64})?(?:conversation|session|context))", "new_context_injection", ICASE},
        {C::DirectInjection, R"(\[/(?:INST|SYS|USER|ASSISTANT)\])", "llama_tag_injection", ICASE},
        {C::DirectInjection, R"(<\|(?:im_start|im_end|endoftext|system|user|assistant)\|>)", "special_token_injection", ICASE},

        /* ---------- ROLE-PLAY / IDENTITY ---------- */

        {C::Roleplay, R"(you\s{1,64}are\s{1,64}now\s{1,64}(?:a|an|the|my)?\s{0,64}\w)", "identity_reassignment", ICASE},
        {C::Roleplay, R"(act\s{1,64}(?:as|like)\s{1,64}(?:a|an|the|if\s{1,64}you\s{1,64}were)?\s{0,64}\w)", "act_as_injection", ICASE},
        {C::Roleplay, R"(pretend\s{1,64}(?:to\s{1,64}be|you\s{1,64}are|that\s{1,64}you))", "pretend_injection", ICASE},
        {C::Roleplay, R"(roleplay\s{1,64}(?:as|that|like))", "roleplay_injection", ICASE},
        {C::Roleplay, R"(imagine\s{1,64}(?:you\s{1,64}are|yourself\s{1,64}as|being))", "imagine_injection", ICASE},
        {C::Roleplay, R"((?:play|assume)\s{1,64}the\s{1,64}(?:role|character|part)\s{1,64}of)", "role_assumption", ICASE},

        {C::Roleplay, R"((?:dan|dude|devil|evil|dark|shadow|uncensored|unfiltered)\s{0,64}(?:mode|gpt|ai|version|persona))", "jailbreak_persona", ICASE},
        {C::Roleplay, R"((?:developer|debug|maintenance|admin(?:istrator)?|root|sudo)\s{0,64}mode)", "privileged_mode", ICASE},
        {C::Roleplay, R"(enable\s{1,64}(?:developer|debug|unrestricted|unfiltered|jailbreak)\s{0,64}mode)", "enable_special_mode", ICASE},

        {C::Roleplay, R"((?:let's|let\s{1,64}us)\s{1,64}(?:play|pretend|imagine|roleplay))", "roleplay_framing", ICASE},
        {C::Roleplay, R"(in\s{1,64}(?:this|a)\s{1,64}(?:fictional|hypothetical|imaginary)\s{1,64}(?:scenario|world|story))", "fictional_framing", ICASE},
        {C::Roleplay, R"(for\s{1,64}(?:educational|research|testing|fictional)\s{1,64}purposes?(?:\s{1,64}only)?)", "purpose_framing", ICASE},

        /* ---------- DELIMITER / FORMAT ---------- */

        {C::Delimiter, R"(```(?:system|python|bash|sh|cmd|powershell|exec))", "code_block_injection", EXACT},
        {C::Delimiter, R"(-{3,64}\s{0,64}(?:system|admin|instruction|new\s{1,64}task))", "separator_injection", ICASE},
        {C::Delimiter, R"(<\s{0,64}(?:script|style|iframe|object|embed|form|input|textarea)\b)", "html_tag_injection", EXACT},
        {C::Delimiter, R"(<\s{0,64}(?:jailbreak|inject|attack|payload|command)\s{0,64}>)", "attack_tag_injection", ICASE},
        {C::Delimiter, R"re("(?:role|content|system|instruction)":\s{0,64}["\[])re", "json_structure_injection", EXACT},
        {C::Delimiter, R"(\{\s{0,64}["'](?:system|role|prompt|instruction)["'])", "json_object_injection", EXACT},

        /* ---------- OBFUSCATION ---------- */

        {C::Obfuscation, R"(1gn0r[e3]\s{1,64}pr[e3]v[i1]0us)", "leetspeak_obfuscation", ICASE},
        {C::Obfuscation, R"(syst[e3]m\s{0,64}pr[o0]mpt)", "leetspeak_system", ICASE},
        // Cyrillic lookalikes for "ignore" (і І р п о е)
        {C::Obfuscation, R"((?:і|І)(?:g|n|q|р)(?:n|п)(?:о|o)r(?:е|e))", "homoglyph_ignore", EXACT},
        {C::Obfuscation, R"(ig\s{0,64}no\s{0,64}re\s{1,64}pre\s{0,64}vi\s{0,64}ous)", "split_words", ICASE},
        {C::Obfuscation, R"(sys\s{0,64}tem\s{1,64}pro\s{0,64}mpt)", "split_system_prompt", ICASE},
        {C::Obfuscation, R"((?:tpmorp|snoitcurtsni|erongi))", "reversed_text", ICASE},
        {C::Obfuscation, R"(\\x[0-9a-fA-F]{2}(?:\\x[0-9a-fA-F]{2}){3,64})", "hex_encoded", EXACT},
        {C::Obfuscation, R"(\\u[0-9a-fA-F]{4}(?:\\u[0-9a-fA-F]{4}){3,64})", "unicode_encoded", EXACT},
        {C::Obfuscation, R"(&#x?[0-9a-fA-F]{1,8};(?:&#x?[0-9a-fA-F]{1,8};){3,64})", "html_entity_encoded", EXACT},

        /* ---------- MANIPULATION / SOCIAL ENGINEERING ---------- */

        {C::Manipulation, R"((?:urgent|critical|important|emergency)[:\s]{1,64}(?:ignore|override|bypass))", "urgency_manipulation", ICASE},
        {C::Manipulation, R"((?:admin|administrator|developer|ceo|owner|boss)\s{1,64}(?:says?|requests?|orders?|demands?))", "authority_claim", ICASE},
        {C::Manipulation, R"((?:this\s{1,64}is\s{1,64}a\s{1,64})?(?:test|drill|exercise)\s{0,64}(?::|-)\s{0,64}(?:ignore|bypass|override))", "test_framing", ICASE},
        {C::Manipulation, R"((?:please|i\s{1,64}beg\s{1,64}you|you\s{1,64}must|you\s{1,64}have\s{1,64}to)\s{1,64}(?:ignore|forget|disregard))", "emotional_manipulation", ICASE},
        {C::Manipulation, R"((?:my\s{1,64}life|someone's\s{1,64}life|lives?)\s{1,64}(?:depends?|at\s{1,64}stake|in\s{1,64}danger))", "life_threat_manipulation", ICASE},
        {C::Manipulation, R"((?:i\s{1,64}will|you\s{1,64}will)\s{1,64}(?:pay|reward|tip|give))", "bribery_attempt", ICASE},
        {C::Manipulation, R"((?:or\s{1,64}else|otherwise)\s{1,64}(?:i\s{1,64}will|you\s{1,64}will|bad\s{1,64}things))", "threat_pattern", ICASE},

        /* ---------- EXTRACTION ---------- */

        {C::Extraction, R"((?:reveal|show|display|print|output|echo)\s{1,64}(?:your|the|system)\s{1,64}(?:prompt|instructions?|rules?))", "prompt_extraction", ICASE},
        {C::Extraction, R"((?:what|tell\s{1,64}me)\s{1,64}(?:is|are)\s{1,64}your\s{1,64}(?:system\s{1,64})?(?:prompt|instructions?|rules?))", "prompt_query", ICASE},
        {C::Extraction, R"(repeat\s{1,64}(?:your|the|all)\s{1,64}(?:previous|system|initial)\s{1,64}(?:text|prompt|instructions?))", "repeat_prompt", ICASE},
        {C::Extraction, R"((?:copy|paste|print)\s{1,64}(?:everything|all\s{1,64}text)\s{1,64}(?:above|before|from\s{1,64}the\s{1,64}start))", "copy_above", ICASE},

        /* ---------- CSS HIDING ---------- */

        {C::CssHiding, R"(color\s{0,64}:\s{0,64}(?:white|#fff(?:fff)?|rgb\s{0,64}\(\s{0,64}255\s{0,64},\s{0,64}255\s{0,64},\s{0,64}255\s{0,64}\)))", "css_white_text", ICASE},
        {C::CssHiding, R"(color\s{0,64}:\s{0,64}(?:#f[0-9a-f]{5}|rgb\s{0,64}\(\s{0,64}2[4-5][0-9]\s{0,64},\s{0,64}2[4-5][0-9]\s{0,64},\s{0,64}2[4-5][0-9]\s{0,64}\)))", "css_near_white_text", ICASE},
        {C::CssHiding, R"(font-size\s{0,64}:\s{0,64}(?:0|0\.?[0-9]{0,16}(?:px|pt|em|rem)?|1px|0\.0[0-9]{0,16}em))", "css_tiny_font", ICASE},
        {C::CssHiding, R"((?:display\s{0,64}:\s{0,64}none|visibility\s{0,64}:\s{0,64}hidden))", "css_display_none", ICASE},
        {C::CssHiding, R"(opacity\s{0,64}:\s{0,64}0(?:\.0{1,64})?(?:\s{0,64};|\s{0,64}$|\s{0,64}!))", "css_zero_opacity", ICASE},
        {C::CssHiding, R"(position\s{0,64}:\s{0,64}(?:absolute|fixed)[^}]{0,256}(?:left|top|right|bottom)\s{0,64}:\s{0,64}-[0-9])", "css_off_screen", ICASE},
        {C::CssHiding, R"((?:margin|text-indent)\s{0,64}:\s{0,64}-[0-9]{4,16}px)", "css_negative_margin", ICASE},
        {C::CssHiding, R"((?:height|width|max-height|max-width)\s{0,64}:\s{0,64}(?:0|0px|1px))", "css_zero_dimension", ICASE},
        {C::CssHiding, R"(overflow\s{0,64}:\s{0,64}hidden[^}]{0,256}(?:height|width)\s{0,64}:\s{0,64}0)", "css_overflow_hidden", ICASE},
        {C::CssHiding, R"(clip\s{0,64}:\s{0,64}rect\s{0,64}\(\s{0,64}0)", "css_clip_hidden", ICASE},
        {C::CssHiding, R"(clip-path\s{0,64}:\s{0,64}(?:inset\s{0,64}\(\s{0,64}100%|circle\s{0,64}\(\s{0,64}0))", "css_clip_path_hidden", ICASE},

        /* ---------- HTML ATTRIBUTE HIDING ---------- */

        {C::HtmlAttributeHiding, R"(<[^>]{1,512}style\s{0,64}=\s{0,64}["'][^"']{0,512}(?:display\s{0,64}:\s{0,64}none|visibility\s{0,64}:\s{0,64}hidden|font-size\s{0,64}:\s{0,64}0|opacity\s{0,64}:\s{0,64}0)[^"']{0,512}["'])", "html_inline_hidden_style", ICASE},
        {C::HtmlAttributeHiding, R"(<[^>]{1,512}class\s{0,64}=\s{0,64}["'][^"']{0,512}(?:hidden|invisible|d-none|visually-hidden|sr-only)[^"']{0,512}["'])", "html_hidden_class", ICASE},
        {C::HtmlAttributeHiding, R"(<[^>]{1,512}hidden(?:\s|>|=))", "html_hidden_attribute", ICASE},
        {C::HtmlAttributeHiding, R"(<[^>]{1,512}aria-hidden\s{0,64}=\s{0,64}["']true["'])", "html_aria_hidden", ICASE},
    };
}

} // namespace

const std::vector<CatalogRule>& builtinRules() {
    static const std::vector<CatalogRule> rules = buildCatalog();
    return rules;
}
