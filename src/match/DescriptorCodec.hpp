#pragma once
#include <map>
#include <optional>
#include <vector>
#include <QString>
#include "include/types.hpp"

// embeddings.descriptor 컬럼 <-> 매칭기 입력 변환.
// 저장 형식은 JSON 숫자 배열 "[0.01,-0.2,...]"
namespace DescriptorCodec {

	QString encode(const FaceEmbedding& v);

	// 배열이 아니거나, 비었거나, 숫자가 아닌/유한하지 않은 원소가 있으면 nullopt
	std::optional<FaceEmbedding> decode(const QString& text);

	struct GroupStats {
		int rows = 0;
		int skipped = 0;			// 파싱 실패 + 차원 불일치
		int identities = 0;
	};

	// 차원별 개수 -> 가장 많은 차원 (동수면 큰 쪽). 비었으면 0
	size_t dominantDimension(const std::map<size_t, int>& histogram);

	// identity_key 별로 묶는다. 깨진 행은 경고 후 건너뛰고,
	// 차원은 expectedDim (0이면 정상 행의 다수 차원) 기준으로 맞춘다
	std::map<QString, std::vector<FaceEmbedding>>
	groupByIdentity(const std::vector<DescriptorRow>& rows, size_t expectedDim = 0,
					GroupStats* stats = nullptr);

} // namespace DescriptorCodec
