#include "deterministic_math.hpp"

#include "errors.hpp"

#include <array>
#include <limits>
#include <stdexcept>

#include <boost/math/constants/constants.hpp>

namespace wh {
namespace {

// round(ln(n + e) * 1e6) for n = 0..255; regenerate with tools/generate_ln_table.
constexpr std::array<std::uint64_t, DeterministicMath::kLnTableSize> kLnShiftedTable = {
    1'000'000, 1'313'262, 1'551'445, 1'743'668, 1'904'832, 2'043'592, 2'165'422, 2'274'009,  // 0..7
    2'371'951, 2'461'150, 2'543'040, 2'618'729, 2'689'090, 2'754'824, 2'816'503, 2'874'597,  // 8..15
    2'929'501, 2'981'546, 3'031'016, 3'078'154, 3'123'170, 3'166'246, 3'207'543, 3'247'202,  // 16..23
    3'285'348, 3'322'092, 3'357'534, 3'391'762, 3'424'858, 3'456'893, 3'487'934, 3'518'040,  // 24..31
    3'547'266, 3'575'663, 3'603'275, 3'630'145, 3'656'312, 3'681'812, 3'706'677, 3'730'939,  // 32..39
    3'754'627, 3'777'766, 3'800'382, 3'822'498, 3'844'136, 3'865'315, 3'886'054, 3'906'373,  // 40..47
    3'926'286, 3'945'811, 3'964'962, 3'983'753, 4'002'198, 4'020'308, 4'038'097, 4'055'574,  // 48..55
    4'072'751, 4'089'638, 4'106'245, 4'122'580, 4'138'653, 4'154'472, 4'170'044, 4'185'377,  // 56..63
    4'200'479, 4'215'356, 4'230'015, 4'244'463, 4'258'704, 4'272'746, 4'286'593, 4'300'251,  // 64..71
    4'313'725, 4'327'020, 4'340'140, 4'353'091, 4'365'875, 4'378'499, 4'390'965, 4'403'278,  // 72..79
    4'415'441, 4'427'457, 4'439'331, 4'451'066, 4'462'665, 4'474'130, 4'485'466, 4'496'675,  // 80..87
    4'507'759, 4'518'722, 4'529'566, 4'540'293, 4'550'907, 4'561'409, 4'571'802, 4'582'089,  // 88..95
    4'592'270, 4'602'349, 4'612'327, 4'622'207, 4'631'990, 4'641'678, 4'651'274, 4'660'778,  // 96..103
    4'670'192, 4'679'519, 4'688'760, 4'697'916, 4'706'989, 4'715'980, 4'724'892, 4'733'724,  // 104..111
    4'742'479, 4'751'159, 4'759'763, 4'768'294, 4'776'753, 4'785'141, 4'793'460, 4'801'709,  // 112..119
    4'809'891, 4'818'007, 4'826'057, 4'834'044, 4'841'966, 4'849'827, 4'857'626, 4'865'365,  // 120..127
    4'873'044, 4'880'665, 4'888'229, 4'895'735, 4'903'186, 4'910'581, 4'917'922, 4'925'210,  // 128..135
    4'932'445, 4'939'628, 4'946'760, 4'953'841, 4'960'873, 4'967'855, 4'974'789, 4'981'675,  // 136..143
    4'988'514, 4'995'307, 5'002'054, 5'008'755, 5'015'412, 5'022'025, 5'028'595, 5'035'122,  // 144..151
    5'041'606, 5'048'048, 5'054'450, 5'060'810, 5'067'131, 5'073'412, 5'079'653, 5'085'856,  // 152..159
    5'092'020, 5'098'147, 5'104'237, 5'110'289, 5'116'305, 5'122'286, 5'128'230, 5'134'140,  // 160..167
    5'140'015, 5'145'855, 5'151'662, 5'157'435, 5'163'175, 5'168'882, 5'174'557, 5'180'200,  // 168..175
    5'185'811, 5'191'391, 5'196'939, 5'202'458, 5'207'946, 5'213'404, 5'218'832, 5'224'231,  // 176..183
    5'229'601, 5'234'942, 5'240'255, 5'245'540, 5'250'797, 5'256'027, 5'261'229, 5'266'405,  // 184..191
    5'271'554, 5'276'676, 5'281'773, 5'286'843, 5'291'888, 5'296'908, 5'301'902, 5'306'872,  // 192..199
    5'311'817, 5'316'738, 5'321'635, 5'326'508, 5'331'357, 5'336'183, 5'340'985, 5'345'765,  // 200..207
    5'350'522, 5'355'257, 5'359'969, 5'364'659, 5'369'327, 5'373'973, 5'378'598, 5'383'202,  // 208..215
    5'387'785, 5'392'346, 5'396'887, 5'401'408, 5'405'908, 5'410'388, 5'414'848, 5'419'288,  // 216..223
    5'423'708, 5'428'109, 5'432'491, 5'436'854, 5'441'197, 5'445'522, 5'449'829, 5'454'116,  // 224..231
    5'458'386, 5'462'637, 5'466'871, 5'471'086, 5'475'284, 5'479'464, 5'483'627, 5'487'773,  // 232..239
    5'491'901, 5'496'013, 5'500'108, 5'504'186, 5'508'247, 5'512'292, 5'516'321, 5'520'333,  // 240..247
    5'524'330, 5'528'311, 5'532'275, 5'536'225, 5'540'158, 5'544'076, 5'547'979, 5'551'867,  // 248..255
};

} // namespace

std::uint64_t DeterministicMath::lnShifted(std::uint32_t n) {
    if (n >= kLnShiftedTable.size()) {
        return kLnShiftedTable.back();
    }
    return kLnShiftedTable[n];
}

std::uint64_t DeterministicMath::lnShiftedReference(std::uint32_t n) {
    HighPrecision shifted = HighPrecision(n) + boost::math::constants::e<HighPrecision>();
    HighPrecision scaled = boost::multiprecision::log(shifted) * HighPrecision(kPrecision);
    return boost::multiprecision::round(scaled).convert_to<std::uint64_t>();
}

std::uint64_t DeterministicMath::proportionalShare(std::uint64_t amount,
                                                   const Wide& weight,
                                                   const Wide& total) {
    if (total <= 0 || weight < 0) {
        throw std::invalid_argument("proportionalShare requires a positive total and non-negative weight");
    }
    Wide share = Wide(amount) * weight / total;
    return toUint64(share);
}

std::uint64_t DeterministicMath::toUint64(const Wide& value) {
    if (value < 0 || value > Wide(std::numeric_limits<std::uint64_t>::max())) {
        throw ProgramError(ErrorCode::ArithmeticOverflow);
    }
    return value.convert_to<std::uint64_t>();
}

std::int64_t DeterministicMath::toInt64(const Wide& value) {
    if (value < Wide(std::numeric_limits<std::int64_t>::min()) ||
        value > Wide(std::numeric_limits<std::int64_t>::max())) {
        throw ProgramError(ErrorCode::ArithmeticOverflow);
    }
    return value.convert_to<std::int64_t>();
}

} // namespace wh
