#include "match/DescriptorCodec.hpp"
#include "log/LogCategories.hpp"

#include <nlohmann/json.hpp>
#include <QDebug>
#include <cmath>
#include <utility>

using json = nlohmann::json;

namespace DescriptorCodec {

QString encode(const FaceEmbedding& v)
{
	json arr = json::array();
	for (float x : v) arr.push_back(x);
	return QString::fromStdString(arr.dump());
}

std::optional<FaceEmbedding> decode(const QString& text)
{
	const json doc = json::parse(text.toStdString(), nullptr, /*allow_exceptions=*/false);
	if (doc.is_discarded() || !doc.is_array() || doc.empty())
		return std::nullopt;

	FaceEmbedding out;
	out.reserve(doc.size());
	for (const auto& el : doc) {
		if (!el.is_number()) return std::nullopt;
		const double d = el.get<double>();
		if (!std::isfinite(d)) return std::nullopt;
		out.push_back(static_cast<float>(d));
	}
	return out;
}

size_t dominantDimension(const std::map<size_t, int>& histogram)
{
	size_t best = 0;
	int bestCount = 0;
	for (const auto& [dim, count] : histogram) {
		if (count >= bestCount) {		// 오름차순 순회 -> 동수면 큰 차원
			best = dim;
			bestCount = count;
		}
	}
	return best;
}

std::map<QString, std::vector<FaceEmbedding>>
groupByIdentity(const std::vector<DescriptorRow>& rows, size_t expectedDim, GroupStats* stats)
{
	std::map<QString, std::vector<FaceEmbedding>> grouped;
	GroupStats st;

	// 1) 파싱
	std::vector<std::pair<const DescriptorRow*, FaceEmbedding>> parsed;
	std::map<size_t, int> dims;
	for (const auto& r : rows) {
		++st.rows;
		auto emb = decode(r.descriptor);
		if (!emb) {
			qCWarning(lcMatch) << "[DescriptorCodec] invalid descriptor for" << r.identityKey << "(skipped)";
			++st.skipped;
			continue;
		}
		++dims[emb->size()];
		parsed.emplace_back(&r, std::move(*emb));
	}

	// 2) 기준 차원: 모델 차원, 모르면 다수결 (행 순서와 무관)
	const size_t dim = expectedDim ? expectedDim : dominantDimension(dims);
	for (auto& [row, emb] : parsed) {
		if (emb.size() != dim) {
			qCWarning(lcMatch) << "[DescriptorCodec] dim mismatch for" << row->identityKey
							   << emb.size() << "vs" << dim << "(skipped)";
			++st.skipped;
			continue;
		}
		grouped[row->identityKey].push_back(std::move(emb));
	}

	st.identities = static_cast<int>(grouped.size());
	if (stats) *stats = st;
	return grouped;
}

} // namespace DescriptorCodec
